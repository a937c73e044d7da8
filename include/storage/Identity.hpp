#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace rh::storage {

// Stored names are "<millis>-<displayName>". The display name is carried verbatim.
struct Identity {
    static std::string encode(const std::string& displayName, std::chrono::system_clock::time_point now);
    static std::string encode(const std::string& displayName, int64_t millis);

    // Strips a leading "<digits>-"; names without that prefix come back unchanged
    static std::string decode(const std::string& storedName);
};

// Hands out strictly increasing millisecond stamps, never behind the wall clock
class StampSource {
public:
    int64_t next(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    std::atomic<int64_t> last_{0};
};

}
