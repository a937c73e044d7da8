// Services
#include "protocols/ProtocolService.hpp"

// Storage
#include "storage/Manager.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "config/util.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace rh::config;
using namespace rh::storage;
using namespace rh::protocols;

namespace {
std::atomic<int> pendingSignal = 0;

void signalHandler(const int signum) {
    pendingSignal = signum;
}

std::filesystem::path configPath(const int argc, char** argv) {
    if (argc > 1) return argv[1];
    if (const char* env = std::getenv("REELHALL_CONFIG"); env && *env) return env;
    return "config/reelhall.yaml";
}
}

int main(const int argc, char** argv) {
    try {
        ConfigRegistry::init(configPath(argc, argv));
    } catch (const std::exception& e) {
        // Logging is not up yet
        spdlog::error("[-] Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }

    try {
        rh::log::Registry::init();
        const auto& cfg = ConfigRegistry::get();

        auto storage = std::make_shared<Manager>(cfg.storage);
        storage->ensureRoot();

        ProtocolService service(storage);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        service.start();

        // Wait for the acceptor so the banner shows the real port
        while (service.isRunning() && service.port() == 0) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        if (service.failed()) return EXIT_FAILURE;

        const auto log = rh::log::Registry::reelhall();
        log->info("[*] Server running on http://{}:{}", cfg.server.host, service.port());
        log->info("[*] Upload directory: {}", storage->root().string());
        log->info("[*] Max file size: {}", bytesToMbOrGbStr(storage->maxUploadBytes()));
        log->info("[*] Allowed extensions: {}", fmt::join(storage->allowedExtensions(), ", "));

        while (service.isRunning()) {
            if (const int sig = pendingSignal.exchange(0); sig == SIGHUP) {
                log->info("[!] SIGHUP received, reopening log files");
                rh::log::Registry::reopenMainLog();
            } else if (sig != 0) {
                log->info("[!] Signal {} received. Shutting down gracefully...", sig);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        const bool failed = service.failed();
        service.stop();

        if (failed) return EXIT_FAILURE;
        log->info("[✓] Reelhall shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (rh::log::Registry::isInitialized()) rh::log::Registry::reelhall()->error("[-] Failed to start Reelhall: {}", e.what());
        else spdlog::error("[-] Failed to start Reelhall: {}", e.what());
        return EXIT_FAILURE;
    }
}
