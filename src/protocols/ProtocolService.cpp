#include "protocols/ProtocolService.hpp"
#include "protocols/http/Server.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Cors.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/Config.hpp"
#include "storage/Manager.hpp"
#include "log/Registry.hpp"

#include <boost/asio/io_context.hpp>
#include <algorithm>
#include <chrono>

using namespace rh::protocols;
using namespace rh::config;

namespace {
constexpr uint64_t MULTIPART_SLACK_BYTES = 1024 * 1024;
}

ProtocolService::ProtocolService(std::shared_ptr<storage::Manager> storage)
    : AsyncService("Reelhall"), storage_(std::move(storage)) {}

ProtocolService::~ProtocolService() {
    stop();
}

void ProtocolService::runLoop() {
    try {
        initHttpServer();
    } catch (const std::exception& e) {
        log::Registry::reelhall()->error("[ProtocolService] Failed to start HTTP server: {}", e.what());
        failed_.store(true);
        shutdown();
        return;
    }

    while (!shouldStop()) std::this_thread::sleep_for(std::chrono::milliseconds(100));

    shutdown();
}

void ProtocolService::initHttpServer() {
    const auto& cfg = ConfigRegistry::get();

    ioContext_ = std::make_shared<asio::io_context>(static_cast<int>(cfg.server.io_threads));
    pool_ = std::make_shared<concurrency::ThreadPool>(cfg.server.worker_threads);

    auto router = std::make_shared<const http::Router>(
        http::model::Context{storage_, cfg.storage.public_prefix}, http::Cors(cfg.cors));

    const http::Session::Limits limits{
        .headerBytes = static_cast<uint32_t>(cfg.server.max_header_bytes),
        .bodyBytes = storage_->maxUploadBytes() + MULTIPART_SLACK_BYTES,
        .maxUploadBytes = storage_->maxUploadBytes()
    };

    const auto endpoint = tcp::endpoint(asio::ip::make_address(cfg.server.host), cfg.server.port);
    httpServer_ = std::make_shared<http::Server>(*ioContext_, endpoint, router, pool_, limits);
    port_.store(httpServer_->localEndpoint().port());
    httpServer_->run();

    const auto n = std::max(1u, cfg.server.io_threads);
    for (unsigned int i = 0; i < n; ++i)
        ioThreads_.emplace_back([ctx = ioContext_] { ctx->run(); });

    log::Registry::reelhall()->debug("[ProtocolService] {} io threads, {} workers", n, pool_->workerCount());
}

void ProtocolService::shutdown() {
    if (httpServer_) httpServer_->close();
    if (ioContext_) ioContext_->stop();
    for (auto& t : ioThreads_) if (t.joinable()) t.join();
    ioThreads_.clear();
    if (pool_) pool_->stop();

    httpServer_.reset();
    pool_.reset();
    ioContext_.reset();
}
