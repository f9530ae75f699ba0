#pragma once

#include "fs/Mirror.hpp"
#include "fs/model/Path.hpp"
#include "sync/model/Outcome.hpp"
#include "watch/Event.hpp"
#include "watch/Listener.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace ms::concurrency {
class ThreadPool;
class PathSerializer;
}

namespace ms::watch {
class Watcher;
}

namespace ms::sync {

namespace model {
class Report;
}

// Live phase. Translates watcher events into mirror operations.
//
// Events received before the watcher's ready signal are discarded. After that
// every event becomes a task keyed by its source-relative path: events for one
// path apply in arrival order, events for different paths run concurrently on
// the worker pool. Unreadable sources and absent or unwritable destinations are
// skipped without retry and recorded as SKIPPED.
class Active final : public watch::Listener {
public:
    Active(fs::model::Path paths,
           std::shared_ptr<watch::Watcher> watcher,
           std::shared_ptr<model::Report> report,
           unsigned int workers = 4,
           std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    ~Active() override;

    Active(const Active&) = delete;
    Active& operator=(const Active&) = delete;

    // Registers with the watcher; returns immediately
    void run();

    // Idempotent. Closes the watcher and drops further events; in-flight tasks still finish.
    void abort();

    [[nodiscard]] bool isReady() const { return ready_.load(); }
    [[nodiscard]] bool isAborted() const { return interruptFlag_->load(); }

    // Reason the watch session died on its own, if it did
    [[nodiscard]] std::optional<std::string> watcherFailure() const;

    // Applies one event synchronously, bypassing the ready gate and the worker pool
    model::Outcome apply(const watch::Event& event) const;

    // Blocks until every dispatched event has been applied
    void waitIdle();

    void onAdded(const std::filesystem::path& path) override;
    void onAddedDirectory(const std::filesystem::path& path) override;
    void onChanged(const std::filesystem::path& path) override;
    void onRemoved(const std::filesystem::path& path) override;
    void onRemovedDirectory(const std::filesystem::path& path) override;
    void onReady() override;

private:
    void dispatch(watch::Event event);

    model::Outcome copy(const watch::Event& event) const;
    model::Outcome remove(const watch::Event& event) const;
    model::Outcome skip(const std::filesystem::path& path, const std::string& reason) const;

    fs::model::Path paths_;
    std::shared_ptr<watch::Watcher> watcher_;
    std::shared_ptr<model::Report> report_;
    fs::Mirror mirror_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;

    std::shared_ptr<concurrency::ThreadPool> pool_;
    std::unique_ptr<concurrency::PathSerializer> serializer_;

    std::atomic<bool> ready_{false};
    std::atomic<bool> closed_{false};
};

}
