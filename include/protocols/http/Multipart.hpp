#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rh::protocols::http::multipart {

// Views into the request body; valid only as long as the body is
struct Part {
    std::string name;
    std::optional<std::string> filename;
    std::string contentType;
    std::string_view data;
};

// boundary parameter of a multipart/form-data Content-Type, unquoted
std::optional<std::string> boundaryFrom(std::string_view contentType);

// Throws std::invalid_argument on a malformed body
std::vector<Part> parse(std::string_view body, std::string_view boundary);

// First part whose form field name matches
std::optional<Part> findField(const std::vector<Part>& parts, std::string_view name);

}
