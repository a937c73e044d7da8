#include "storage/model/StoredFile.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace rh::storage::model {

nlohmann::json toJson(const StoredFile& f, const std::string& publicPrefix) {
    nlohmann::json j = {
        {"filename", f.storedName},
        {"originalName", f.displayName},
        {"size", f.sizeBytes},
        {"uploadDate", util::toIso8601Millis(f.createdAt)},
        {"url", publicPrefix + "/" + f.storedName}
    };

    if (f.mimeType) j["mimeType"] = *f.mimeType;
    else j["mimeType"] = false;

    return j;
}

}
