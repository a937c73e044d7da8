#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace rh::concurrency;

ThreadPool::ThreadPool(unsigned int nThreads) {
    if (nThreads == 0) nThreads = std::max(1u, std::thread::hardware_concurrency());
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        stopFlag.store(true);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
    }
    cv.notify_all();

    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        // A task that stops its own pool cannot join itself
        if (std::this_thread::get_id() == t.get_id()) t.detach();
        else t.join();
    }

    threads_.clear();
}

bool ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) return false;
        queue.push(std::move(task));
    }
    cv.notify_one();
    return true;
}

bool ThreadPool::submit(std::function<void()> fn) {
    return submit(std::make_shared<FunctionTask>(std::move(fn)));
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] { return stopFlag.load() || !queue.empty(); });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (!task) continue;
            try {
                (*task)();
            } catch (const std::exception& e) {
                log::Registry::reelhall()->error("[ThreadPool] Task failed: {}", e.what());
            }
        }
    });
}
