#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace rh::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["io_threads"] = rhs.io_threads;
        node["worker_threads"] = rhs.worker_threads;
        node["max_header_bytes"] = rhs.max_header_bytes;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        // Numbers are strict: a present but unparseable value is a startup error
        if (node["port"]) rhs.port = node["port"].as<uint16_t>();
        if (node["io_threads"]) rhs.io_threads = node["io_threads"].as<unsigned int>();
        if (node["worker_threads"]) rhs.worker_threads = node["worker_threads"].as<unsigned int>();
        if (node["max_header_bytes"]) rhs.max_header_bytes = node["max_header_bytes"].as<uintmax_t>();
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        node["public_prefix"] = rhs.public_prefix;
        node["max_upload_size"] = bytesToMbOrGbStr(rhs.max_upload_size_bytes);
        node["allowed_extensions"] = rhs.allowed_extensions;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("uploads");
        rhs.public_prefix = node["public_prefix"].as<std::string>("/files/uploads");
        if (node["max_upload_size"])
            rhs.max_upload_size_bytes = parseMbOrGbToByte(node["max_upload_size"].as<std::string>());
        if (node["allowed_extensions"])
            rhs.allowed_extensions = normalizeExtensions(node["allowed_extensions"].as<std::vector<std::string>>());
        return true;
    }
};

template<>
struct convert<CorsConfig> {
    static Node encode(const CorsConfig& rhs) {
        Node node;
        node["allowed_origins"] = rhs.allowed_origins;
        node["allow_credentials"] = rhs.allow_credentials;
        return node;
    }

    static bool decode(const Node& node, CorsConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["allowed_origins"])
            rhs.allowed_origins = node["allowed_origins"].as<std::vector<std::string>>();
        rhs.allow_credentials = node["allow_credentials"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["reelhall"] = to_std_string(spdlog::level::to_string_view(rhs.reelhall));
        node["http"]     = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.reelhall = spdlog::level::from_str(node["reelhall"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"])
            rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("logs");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
