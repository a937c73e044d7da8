#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace rh::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = std::filesystem::exists(path) ? loadConfig(path) : Config{};
        applyEnvironment(config_);
        config_.storage.allowed_extensions = normalizeExtensions(config_.storage.allowed_extensions);
        initialized_ = true;
    });
}

void ConfigRegistry::init(Config cfg) {
    std::call_once(init_flag_, [&]() {
        config_ = std::move(cfg);
        config_.storage.allowed_extensions = normalizeExtensions(config_.storage.allowed_extensions);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace rh::config
