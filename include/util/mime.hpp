#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rh::util {

// Lower-cased extension including the dot (".mp4"), or "" when there is none
std::string extensionOf(std::string_view filename);

// Media type for an extension, looked up case-insensitively
std::optional<std::string> mimeTypeForExtension(std::string_view ext);

inline std::optional<std::string> mimeTypeFor(const std::string_view filename) {
    return mimeTypeForExtension(extensionOf(filename));
}

inline bool isStreamable(const std::string_view mimeType) { return mimeType.starts_with("video/"); }

}
