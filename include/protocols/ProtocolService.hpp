#pragma once

#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

namespace boost::asio { class io_context; }

namespace rh::storage { class Manager; }
namespace rh::concurrency { class ThreadPool; }

namespace rh::protocols {

namespace http { class Server; class Router; }

// Owns the io_context, its threads, the worker pool and the HTTP server
class ProtocolService final : public concurrency::AsyncService {
public:
    explicit ProtocolService(std::shared_ptr<storage::Manager> storage);
    ~ProtocolService() override;

    // Set when the server could not start; the loop has already returned
    [[nodiscard]] bool failed() const { return failed_.load(); }

    // 0 until the acceptor is bound
    [[nodiscard]] uint16_t port() const { return port_.load(); }

protected:
    void runLoop() override;

private:
    std::shared_ptr<storage::Manager> storage_;
    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    std::shared_ptr<http::Server> httpServer_;
    std::vector<std::thread> ioThreads_;
    std::atomic<bool> failed_{false};
    std::atomic<uint16_t> port_{0};

    void initHttpServer();
    void shutdown();
};

}
