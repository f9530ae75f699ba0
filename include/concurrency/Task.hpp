#pragma once

#include <functional>
#include <utility>

namespace ms::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

struct FunctionTask : Task {
    std::function<void()> fn;

    explicit FunctionTask(std::function<void()> fn) : fn(std::move(fn)) {}

    void operator()() override { if (fn) fn(); }
};

}
