#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace rh::config {

constexpr static uintmax_t MAX_UPLOAD_SIZE_BYTES = static_cast<uintmax_t>(500) * 1024 * 1024; // 500MB
constexpr static uintmax_t DEFAULT_MAX_HEADER_BYTES = 8 * 1024;

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    unsigned int io_threads = 2;
    unsigned int worker_threads = 4;
    uintmax_t max_header_bytes = DEFAULT_MAX_HEADER_BYTES;
};

struct StorageConfig {
    std::filesystem::path root = "uploads";
    std::string public_prefix = "/files/uploads";
    uintmax_t max_upload_size_bytes = MAX_UPLOAD_SIZE_BYTES;
    std::vector<std::string> allowed_extensions = {
        ".mp4", ".webm", ".ogg", ".mov", ".png", ".jpg", ".jpeg", ".pdf"
    };
};

struct CorsConfig {
    std::vector<std::string> allowed_origins = {"http://localhost:3000", "http://localhost:5173"};
    bool allow_credentials = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum reelhall = spdlog::level::info;   // Startup, shutdown, banner
    spdlog::level::level_enum http     = spdlog::level::info;   // Requests, 5xx causes
    spdlog::level::level_enum storage  = spdlog::level::warn;   // Underlying I/O issues
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "logs";
    LogLevelsConfig levels;
};

struct Config {
    ServerConfig server;
    StorageConfig storage;
    CorsConfig cors;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

// PORT and REELHALL_UPLOAD_DIR override the file values
void applyEnvironment(Config& cfg);

// Lower-cases extensions and adds the leading dot where missing
std::vector<std::string> normalizeExtensions(const std::vector<std::string>& exts);

} // namespace rh::config
