#include "concurrency/ThreadPool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace rh::concurrency;

TEST(ThreadPoolTest, RunsSubmittedTasks) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.workerCount(), 3u);

    std::atomic<int> count{0};
    std::promise<void> done;
    constexpr int N = 50;

    for (int i = 0; i < N; ++i)
        ASSERT_TRUE(pool.submit([&] {
            if (++count == N) done.set_value();
        }));

    ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(count.load(), N);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    ThreadPool pool(1);
    pool.submit([] { throw std::runtime_error("boom"); });

    std::promise<void> done;
    pool.submit([&] { done.set_value(); });
    EXPECT_EQ(done.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST(ThreadPoolTest, SubmitAfterStopIsRefused) {
    ThreadPool pool(2);
    pool.stop();
    EXPECT_TRUE(pool.isStopped());
    EXPECT_EQ(pool.workerCount(), 0u);
    EXPECT_FALSE(pool.submit([] {}));
}
