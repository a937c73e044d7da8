#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace rh::storage::model {

struct StoredFile {
    std::string storedName;
    std::string displayName;
    uintmax_t sizeBytes{0};
    std::chrono::system_clock::time_point createdAt{};
    std::optional<std::string> mimeType;
};

// url is "<publicPrefix>/<storedName>"
nlohmann::json toJson(const StoredFile& f, const std::string& publicPrefix);

}
