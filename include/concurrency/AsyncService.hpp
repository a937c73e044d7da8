#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace rh::concurrency {

// A named background loop with start/stop; runLoop() must return once shouldStop() is set
class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    virtual void runLoop() = 0;
};

}
