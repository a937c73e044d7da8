#pragma once

#include <chrono>
#include <ctime>
#include <string>

#include <fmt/format.h>

namespace rh::util {

// ISO 8601 UTC with milliseconds, e.g. 2024-03-01T12:00:00.123Z
inline std::string toIso8601Millis(const std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(ms);
    auto rem = ms - secs;
    if (rem.count() < 0) {
        secs -= seconds(1);
        rem += seconds(1);
    }

    const std::time_t t = secs.count();
    std::tm tm{};
    gmtime_r(&t, &tm);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, rem.count());
}

inline std::string getCurrentTimestamp() { return toIso8601Millis(std::chrono::system_clock::now()); }

} // namespace rh::util
