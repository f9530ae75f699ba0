#pragma once

#include "watch/Watcher.hpp"
#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ms::watch {

// Recursive watcher on top of Linux inotify. One watch descriptor per
// directory; directories created later get a watch before they are reported.
// Symlinks and special files are never reported as added or changed.
class InotifyWatcher final : public Watcher, public concurrency::AsyncService {
public:
    explicit InotifyWatcher(std::filesystem::path root, unsigned int pollIntervalMs = 250);

    ~InotifyWatcher() override;

    void watch(Listener& listener) override;

    void close() override;

    [[nodiscard]] bool isClosed() const override { return closed_.load(); }

    [[nodiscard]] std::optional<std::string> failure() const override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    [[nodiscard]] size_t watchCount() const;

protected:
    void runLoop() override;

private:
    void readEvents();
    void addWatchTree(const std::filesystem::path& dir, bool report);
    void dropWatchTree(const std::filesystem::path& dir);
    void handle(int wd, uint32_t mask, const char* name);

    template <typename Fn>
    void emit(Fn&& fn) {
        if (!closed_.load() && listener_) fn(*listener_);
    }

    std::filesystem::path root_;
    unsigned int pollIntervalMs_;

    int fd_ = -1;
    Listener* listener_ = nullptr;
    std::atomic<bool> closed_{false};

    // Serializes watch() against close() so start() and stop() never overlap
    std::mutex lifecycleMutex_;

    mutable std::mutex failureMutex_;
    std::optional<std::string> failure_;

    mutable std::mutex watchMutex_;
    std::unordered_map<int, std::filesystem::path> watches_;
};

}
