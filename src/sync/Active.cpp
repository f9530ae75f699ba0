#include "sync/Active.hpp"
#include "sync/model/Report.hpp"
#include "concurrency/PathSerializer.hpp"
#include "concurrency/ThreadPool.hpp"
#include "fs/ops/probe.hpp"
#include "watch/Watcher.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::concurrency;
using namespace ms::fs::ops;
using namespace ms::fs::model;
using namespace ms::watch;

Active::Active(Path paths,
               std::shared_ptr<Watcher> watcher,
               std::shared_ptr<Report> report,
               const unsigned int workers,
               std::shared_ptr<std::atomic<bool>> interruptFlag)
    : paths_(std::move(paths)),
      watcher_(std::move(watcher)),
      report_(report ? std::move(report) : std::make_shared<Report>()),
      mirror_(report_),
      interruptFlag_(interruptFlag ? std::move(interruptFlag) : std::make_shared<std::atomic<bool>>(false)),
      pool_(std::make_shared<ThreadPool>(workers == 0 ? 1 : workers)),
      serializer_(std::make_unique<PathSerializer>(pool_)) {
    if (!watcher_) throw std::invalid_argument("Active requires a watcher");
}

Active::~Active() {
    abort();
    pool_->stop();
}

void Active::run() {
    if (isAborted()) {
        log::Registry::sync()->info("[Active] Aborted before the watch session started");
        return;
    }

    log::Registry::sync()->debug("[Active] Watching {}", paths_.sourceRoot.string());
    watcher_->watch(*this);
}

void Active::abort() {
    interruptFlag_->store(true);
    if (closed_.exchange(true)) return;

    watcher_->close();
    log::Registry::sync()->info("[Active] Watch session on {} closed", paths_.sourceRoot.string());
}

std::optional<std::string> Active::watcherFailure() const {
    return watcher_->failure();
}

void Active::waitIdle() {
    serializer_->waitIdle();
}

void Active::onAdded(const std::filesystem::path& path) { dispatch({Event::Type::ADDED, path}); }
void Active::onAddedDirectory(const std::filesystem::path& path) { dispatch({Event::Type::ADDED_DIRECTORY, path}); }
void Active::onChanged(const std::filesystem::path& path) { dispatch({Event::Type::CHANGED, path}); }
void Active::onRemoved(const std::filesystem::path& path) { dispatch({Event::Type::REMOVED, path}); }
void Active::onRemovedDirectory(const std::filesystem::path& path) { dispatch({Event::Type::REMOVED_DIRECTORY, path}); }

void Active::onReady() {
    if (ready_.exchange(true)) return;
    log::Registry::sync()->info("[Active] Watcher ready, mirroring live changes");
}

void Active::dispatch(Event event) {
    if (!ready_.load() || isAborted()) return;

    // Runs on the watcher's thread; a throw here would end the watch session
    std::string key;
    try {
        key = paths_.relPath(event.path, PathType::SOURCE_ROOT).string();
    } catch (const std::invalid_argument& e) {
        log::Registry::sync()->error("[Active] Dropping {} event: {}", to_string(event.type), e.what());
        report_->record(Outcome::error(event.path, e.what()));
        return;
    }

    serializer_->submit(key, [this, event = std::move(event)] {
        try {
            apply(event);
        } catch (const std::exception& e) {
            log::Registry::sync()->error("[Active] Failed to apply {} on {}: {}", to_string(event.type), event.path.string(), e.what());
            report_->record(Outcome::error(event.path, e.what()));
        }
    });
}

Outcome Active::apply(const Event& event) const {
    log::Registry::sync()->trace("[Active] {} {}", to_string(event.type), event.path.string());
    return event.isRemoval() ? remove(event) : copy(event);
}

Outcome Active::copy(const Event& event) const {
    const auto dest = paths_.toDest(event.path);
    if (!canRead(event.path)) return skip(event.path, "source unreadable");

    if (event.type == Event::Type::ADDED_DIRECTORY) return mirror_.copyDirectory(event.path, dest);
    return mirror_.copyFile(event.path, dest);
}

Outcome Active::remove(const Event& event) const {
    const auto dest = paths_.toDest(event.path);
    if (!fs::ops::exists(dest)) return skip(dest, "destination absent");
    if (!canWrite(dest)) return skip(dest, "destination unwritable");

    if (event.type == Event::Type::REMOVED_DIRECTORY) return mirror_.removeDirectory(dest);
    return mirror_.removeFile(dest);
}

Outcome Active::skip(const std::filesystem::path& path, const std::string& reason) const {
    log::Registry::sync()->debug("[Active] Skipping {}: {}", path.string(), reason);
    auto outcome = Outcome::skipped(path, reason);
    report_->record(outcome);
    return outcome;
}
