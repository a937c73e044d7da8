#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <stdexcept>

namespace rh::config {

inline uintmax_t parseMbOrGbToByte(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Size string cannot be empty");

    if (str.size() > 2 && (str.substr(str.size() - 2) == "GB" || str.substr(str.size() - 2) == "gb")) {
        const auto gb = std::stoull(str.substr(0, str.size() - 2));
        return gb * 1024 * 1024 * 1024;
    }

    if (str.size() > 1 && (str.back() == 'G' || str.back() == 'g')) {
        const auto gb = std::stoull(str.substr(0, str.size() - 1));
        return gb * 1024 * 1024 * 1024;
    }

    if (str.size() > 2 && (str.substr(str.size() - 2) == "MB" || str.substr(str.size() - 2) == "mb")) {
        const auto mb = std::stoull(str.substr(0, str.size() - 2));
        return mb * 1024 * 1024;
    }

    if (str.size() > 1 && (str.back() == 'M' || str.back() == 'm')) {
        const auto mb = std::stoull(str.substr(0, str.size() - 1));
        return mb * 1024 * 1024;
    }

    // Assume MB if no suffix
    const auto mb = std::stoull(str);
    return mb * 1024 * 1024;
}

inline std::string bytesToMbOrGbStr(const uintmax_t bytes) {
    if (bytes != 0 && bytes % (1024 * 1024 * 1024) == 0) return std::to_string(bytes / (1024 * 1024 * 1024)) + "GB";
    return std::to_string(bytes / (1024 * 1024)) + "MB";
}

// Upload ceiling as shown to clients: fractional MB, no rounding ("0.0625MB", "500MB")
inline std::string bytesToFractionalMbStr(const uintmax_t bytes) {
    return fmt::format("{}MB", static_cast<double>(bytes) / (1024 * 1024));
}

inline uint16_t parsePort(const std::string& str) {
    std::size_t consumed = 0;
    const auto value = std::stoul(str, &consumed);
    if (consumed != str.size() || value == 0 || value > 65535)
        throw std::invalid_argument("Invalid port: " + str);
    return static_cast<uint16_t>(value);
}

}
