#pragma once

#include <functional>
#include <utility>

namespace rh::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Adapts any callable; used for per-request routing work
struct FunctionTask : Task {
    std::function<void()> fn;

    explicit FunctionTask(std::function<void()> f) : fn(std::move(f)) {}

    void operator()() override { fn(); }
};

}
