#include "sync/Controller.hpp"
#include "sync/Active.hpp"
#include "sync/Initial.hpp"
#include "sync/model/Report.hpp"
#include "watch/InotifyWatcher.hpp"
#include "log/Registry.hpp"

#include <cstdlib>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::fs::model;

namespace ms::sync {

std::string to_string(const Controller::State state) {
    switch (state) {
    case Controller::State::IDLE: return "idle";
    case Controller::State::VALIDATING: return "validating";
    case Controller::State::INITIAL_SYNC: return "initial-sync";
    case Controller::State::WATCHING: return "watching";
    case Controller::State::ABORTED: return "aborted";
    case Controller::State::FAILED: return "failed";
    case Controller::State::DONE: return "done";
    }
    return "unknown";
}

int exitCodeFor(const ValidationError::Kind kind) {
    switch (kind) {
    case ValidationError::Kind::SOURCE_MISSING: return 2;
    case ValidationError::Kind::SOURCE_UNREADABLE: return 3;
    case ValidationError::Kind::DEST_TYPE_MISMATCH: return 4;
    case ValidationError::Kind::DEST_UNWRITABLE: return 5;
    case ValidationError::Kind::DEST_UNCREATABLE: return 6;
    }
    return EXIT_FAILURE;
}

}

Controller::Controller(const std::filesystem::path& source,
                       const std::filesystem::path& dest,
                       const Options options,
                       WatcherFactory factory)
    : AsyncService("Controller"),
      paths_(source, dest),
      options_(options),
      factory_(std::move(factory)),
      report_(std::make_shared<Report>()),
      abortFlag_(std::make_shared<std::atomic<bool>>(false)) {
    if (!factory_) {
        const auto interval = options_.pollIntervalMs;
        factory_ = [interval](const std::filesystem::path& root) {
            return std::make_shared<watch::InotifyWatcher>(root, interval);
        };
    }
}

Controller::~Controller() {
    stop();
}

void Controller::stop() {
    abort();
    AsyncService::stop();
}

void Controller::abort() {
    std::shared_ptr<Initial> initial;
    std::shared_ptr<Active> active;
    {
        std::scoped_lock lock(mutex_);
        if (abortFlag_->exchange(true)) return;
        initial = initial_;
        active = active_;
    }

    log::Registry::mirrorsync()->info("[Controller] Abort requested");

    if (initial) initial->abort();
    if (active) active->abort();
    stateCv_.notify_all();
}

Controller::State Controller::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

bool Controller::isFinished() const {
    const auto s = state();
    return s == State::ABORTED || s == State::FAILED || s == State::DONE;
}

bool Controller::waitForState(const State state, const std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return stateCv_.wait_for(lock, timeout, [&] { return state_ == state; });
}

bool Controller::waitUntilFinished(const std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return stateCv_.wait_for(lock, timeout, [&] {
        return state_ == State::ABORTED || state_ == State::FAILED || state_ == State::DONE;
    });
}

std::optional<ValidationError::Kind> Controller::validationError() const {
    std::scoped_lock lock(mutex_);
    return validationError_;
}

std::string Controller::failureReason() const {
    std::scoped_lock lock(mutex_);
    return failureReason_;
}

int Controller::exitCode() const {
    std::scoped_lock lock(mutex_);
    if (state_ != State::FAILED) return EXIT_SUCCESS;
    if (validationError_) return exitCodeFor(*validationError_);
    return EXIT_FAILURE;
}

void Controller::setState(const State state) {
    {
        std::scoped_lock lock(mutex_);
        state_ = state;
    }
    log::Registry::mirrorsync()->debug("[Controller] State -> {}", to_string(state));
    stateCv_.notify_all();
}

void Controller::fail(const std::string& reason, const std::optional<ValidationError::Kind> kind) {
    {
        std::scoped_lock lock(mutex_);
        failureReason_ = reason;
        validationError_ = kind;
    }
    setState(State::FAILED);
}

bool Controller::abortedAt(const char* checkpoint) {
    if (!isAborted()) return false;
    log::Registry::mirrorsync()->info("[Controller] Aborted {}", checkpoint);
    setState(State::ABORTED);
    return true;
}

void Controller::runLoop() {
    if (abortedAt("before validation")) return;
    setState(State::VALIDATING);

    try {
        assertSource(paths_.sourceRoot);
        assertDestination(paths_.destRoot);
    } catch (const ValidationError& e) {
        log::Registry::mirrorsync()->error("[Controller] {} ({})", e.what(), e.code());
        fail(e.what(), e.kind());
        return;
    }

    if (abortedAt("before the initial phase")) return;
    setState(State::INITIAL_SYNC);
    log::Registry::mirrorsync()->info("[*] Synchronizing the source with the destination. Please wait...");

    {
        std::scoped_lock lock(mutex_);
        initial_ = std::make_shared<Initial>(paths_, report_, abortFlag_);
    }

    try {
        initial_->run();
    } catch (const std::exception& e) {
        log::Registry::mirrorsync()->error("[Controller] Initial synchronization failed: {}", e.what());
        fail(e.what());
        return;
    }

    {
        std::scoped_lock lock(mutex_);
        initial_.reset();
    }

    if (abortedAt("after the initial phase")) return;

    if (!options_.watch) {
        log::Registry::mirrorsync()->info("[✓] Destination is in sync: {}", report_->summary());
        setState(State::DONE);
        return;
    }

    if (abortedAt("before starting the watcher")) return;

    try {
        auto active = std::make_shared<Active>(paths_, factory_(paths_.sourceRoot), report_, options_.workers, abortFlag_);
        {
            std::scoped_lock lock(mutex_);
            active_ = active;
        }
        // abort() may have run before active_ was published
        if (isAborted()) active->abort();
        else active->run();
    } catch (const std::exception& e) {
        // A watcher closed by abort() may refuse to start
        if (abortedAt("while starting the watcher")) {
            log::Registry::mirrorsync()->debug("[Controller] Watcher start interrupted: {}", e.what());
            return;
        }
        log::Registry::mirrorsync()->error("[Controller] Unable to start the watcher: {}", e.what());
        fail(e.what());
        return;
    }

    if (abortedAt("while starting the watcher")) return;

    log::Registry::mirrorsync()->info("[*] Observing changes to the source directory.");
    setState(State::WATCHING);

    const std::chrono::milliseconds interval(options_.pollIntervalMs == 0 ? 1 : options_.pollIntervalMs);
    while (true) {
        {
            std::unique_lock lock(mutex_);
            if (stateCv_.wait_for(lock, interval, [this] { return abortFlag_->load(); })) break;
        }

        if (const auto failure = active_->watcherFailure()) {
            log::Registry::mirrorsync()->error("[Controller] Watcher stopped unexpectedly: {}", *failure);
            active_->abort();
            fail(*failure);
            return;
        }
    }

    active_->abort();
    setState(State::ABORTED);
}
