#include "concurrency/PathSerializer.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ms::concurrency;

PathSerializer::PathSerializer(std::shared_ptr<ThreadPool> pool)
    : pool_(std::move(pool)) {
    if (!pool_) throw std::invalid_argument("PathSerializer requires a thread pool");
}

void PathSerializer::submit(const std::string& key, std::function<void()> fn) {
    bool startStrand = false;
    {
        std::scoped_lock lock(mutex_);
        auto [it, inserted] = strands_.try_emplace(key);
        it->second.push_back(std::move(fn));
        ++pending_;
        startStrand = inserted;
    }

    // An existing strand picks the new item up when it reaches it
    if (!startStrand) return;

    try {
        pool_->submit(std::make_shared<FunctionTask>([this, key] { drain(key); }));
    } catch (...) {
        std::scoped_lock lock(mutex_);
        if (const auto it = strands_.find(key); it != strands_.end()) {
            pending_ -= it->second.size();
            strands_.erase(it);
        }
        if (pending_ == 0) idleCv_.notify_all();
        throw;
    }
}

void PathSerializer::drain(const std::string& key) {
    while (true) {
        std::function<void()> fn;
        {
            std::scoped_lock lock(mutex_);
            // The running item stays queued so concurrent submits see a live strand
            fn = std::move(strands_.at(key).front());
        }

        try {
            if (fn) fn();
        } catch (const std::exception& e) {
            log::Registry::sync()->error("[PathSerializer] Work for '{}' failed: {}", key, e.what());
        } catch (...) {
            log::Registry::sync()->error("[PathSerializer] Work for '{}' failed: unknown exception", key);
        }

        std::scoped_lock lock(mutex_);
        const auto it = strands_.find(key);
        it->second.pop_front();
        --pending_;

        const bool done = it->second.empty();
        if (done) strands_.erase(it);
        if (pending_ == 0) idleCv_.notify_all();
        if (done) return;
    }
}

void PathSerializer::waitIdle() {
    std::unique_lock lock(mutex_);
    idleCv_.wait(lock, [this] { return pending_ == 0; });
}

size_t PathSerializer::pending() const {
    std::scoped_lock lock(mutex_);
    return pending_;
}

size_t PathSerializer::activeKeys() const {
    std::scoped_lock lock(mutex_);
    return strands_.size();
}
