#include "storage/Identity.hpp"

#include <algorithm>
#include <cctype>

using namespace rh::storage;
using namespace std::chrono;

std::string Identity::encode(const std::string& displayName, const system_clock::time_point now) {
    return encode(displayName, duration_cast<milliseconds>(now.time_since_epoch()).count());
}

std::string Identity::encode(const std::string& displayName, const int64_t millis) {
    return std::to_string(millis) + "-" + displayName;
}

std::string Identity::decode(const std::string& storedName) {
    const auto digitsEnd = std::find_if_not(storedName.begin(), storedName.end(),
                                            [](const unsigned char c) { return std::isdigit(c); });
    if (digitsEnd == storedName.begin() || digitsEnd == storedName.end() || *digitsEnd != '-')
        return storedName;
    return {digitsEnd + 1, storedName.end()};
}

int64_t StampSource::next(const system_clock::time_point now) {
    const auto nowMs = duration_cast<milliseconds>(now.time_since_epoch()).count();
    auto prev = last_.load(std::memory_order_relaxed);
    int64_t candidate;
    do {
        candidate = std::max(nowMs, prev + 1);
    } while (!last_.compare_exchange_weak(prev, candidate, std::memory_order_relaxed));
    return candidate;
}
