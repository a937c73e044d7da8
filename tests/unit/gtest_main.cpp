#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        rh::config::Config cfg;
        cfg.logging.log_dir = fs::temp_directory_path() / "reelhall_test_logs";
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        cfg.logging.levels.subsystem_levels.http = spdlog::level::warn;
        cfg.logging.levels.subsystem_levels.reelhall = spdlog::level::warn;
        rh::config::ConfigRegistry::init(std::move(cfg));
        rh::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize Reelhall test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
