#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ms::concurrency {

class ThreadPool;

// Per-key FIFO strands on top of a shared pool. Work submitted under the same
// key runs one item at a time in submission order; distinct keys run concurrently.
class PathSerializer {
public:
    explicit PathSerializer(std::shared_ptr<ThreadPool> pool);

    PathSerializer(const PathSerializer&) = delete;
    PathSerializer& operator=(const PathSerializer&) = delete;

    void submit(const std::string& key, std::function<void()> fn);

    // Blocks until every submitted item has run
    void waitIdle();

    [[nodiscard]] size_t pending() const;
    [[nodiscard]] size_t activeKeys() const;

private:
    void drain(const std::string& key);

    std::shared_ptr<ThreadPool> pool_;

    mutable std::mutex mutex_;
    std::condition_variable idleCv_;
    std::unordered_map<std::string, std::deque<std::function<void()>>> strands_;
    size_t pending_ = 0;
};

}
