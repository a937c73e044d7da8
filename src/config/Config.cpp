#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace rh::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["server"]) cfg.server = node.as<ServerConfig>();
    if (auto node = root["storage"]) cfg.storage = node.as<StorageConfig>();
    if (auto node = root["cors"]) cfg.cors = node.as<CorsConfig>();
    if (auto node = root["logging"]) cfg.logging = node.as<LoggingConfig>();

    return cfg;
}

void applyEnvironment(Config& cfg) {
    if (const char* port = std::getenv("PORT"); port && *port) cfg.server.port = parsePort(port);
    if (const char* dir = std::getenv("REELHALL_UPLOAD_DIR"); dir && *dir) cfg.storage.root = dir;
}

std::vector<std::string> normalizeExtensions(const std::vector<std::string>& exts) {
    std::vector<std::string> out;
    out.reserve(exts.size());
    for (auto ext : exts) {
        if (ext.empty()) continue;
        std::ranges::transform(ext, ext.begin(), [](const unsigned char c) { return std::tolower(c); });
        if (ext.front() != '.') ext.insert(ext.begin(), '.');
        if (std::ranges::find(out, ext) == out.end()) out.push_back(std::move(ext));
    }
    return out;
}

} // namespace rh::config
