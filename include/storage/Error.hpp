#pragma once

#include <stdexcept>
#include <string>

namespace rh::storage {

class Error : public std::runtime_error {
public:
    enum class Reason { PathTraversal, NotFound, TooLarge, UnsupportedType };

    Error(const Reason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {}

    [[nodiscard]] Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

}
