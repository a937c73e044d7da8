#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace rh::concurrency {

// Fixed set of workers draining one FIFO queue
class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks, lets running ones finish
    void stop();

    // Returns false once the pool is stopping
    bool submit(std::shared_ptr<Task> task);
    bool submit(std::function<void()> fn);

    [[nodiscard]] unsigned int workerCount() const;

    [[nodiscard]] bool isStopped() const { return stopFlag.load(); }

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace rh::concurrency
