#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rh::protocols::http::range {

// "bytes=<start>-[<end>]" as written by the client, not yet checked against a size
struct ByteRange {
    uint64_t start{0};
    std::optional<uint64_t> end;
};

// Single-range syntax only. Suffix ranges ("bytes=-N"), lists and junk yield nullopt.
std::optional<ByteRange> parse(std::string_view header);

struct Resolution {
    enum class Kind { Full, Partial, Unsatisfiable };

    Kind kind{Kind::Full};
    uint64_t start{0};
    uint64_t end{0};       // inclusive; meaningless for Unsatisfiable
    uint64_t totalSize{0};

    [[nodiscard]] unsigned int status() const noexcept;
    [[nodiscard]] uint64_t contentLength() const noexcept;

    // "bytes <start>-<end>/<total>" for Partial, "bytes */<total>" for Unsatisfiable, "" otherwise
    [[nodiscard]] std::string contentRange() const;
};

// An end past the file is clamped to totalSize - 1; a start past the file, or
// past the end, is unsatisfiable. Unparseable headers are ignored.
Resolution resolve(uint64_t totalSize, std::optional<std::string_view> rangeHeader, bool rangeable);

}
