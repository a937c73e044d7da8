#include "util/mime.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace rh::util {

namespace {

const std::unordered_map<std::string_view, std::string_view>& mimeTable() {
    static const std::unordered_map<std::string_view, std::string_view> table = {
        // video
        {".mp4", "video/mp4"},
        {".m4v", "video/x-m4v"},
        {".webm", "video/webm"},
        {".mov", "video/quicktime"},
        {".mkv", "video/x-matroska"},
        {".avi", "video/x-msvideo"},
        {".ogv", "video/ogg"},
        {".mpeg", "video/mpeg"},
        {".mpg", "video/mpeg"},
        // audio
        {".ogg", "audio/ogg"},
        {".oga", "audio/ogg"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".flac", "audio/flac"},
        {".m4a", "audio/mp4"},
        // images
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        // documents
        {".pdf", "application/pdf"},
        {".txt", "text/plain"},
        {".json", "application/json"},
    };
    return table;
}

}

std::string extensionOf(const std::string_view filename) {
    const auto dot = filename.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0) return "";
    std::string ext(filename.substr(dot));
    std::ranges::transform(ext, ext.begin(), [](const unsigned char c) { return std::tolower(c); });
    return ext;
}

std::optional<std::string> mimeTypeForExtension(const std::string_view ext) {
    std::string key(ext);
    std::ranges::transform(key, key.begin(), [](const unsigned char c) { return std::tolower(c); });
    const auto& table = mimeTable();
    if (const auto it = table.find(key); it != table.end()) return std::string(it->second);
    return std::nullopt;
}

}
