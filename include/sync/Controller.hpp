#pragma once

#include "concurrency/AsyncService.hpp"
#include "fs/model/Path.hpp"
#include "sync/Validator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ms::watch {
class Watcher;
}

namespace ms::sync {

namespace model {
class Report;
}

class Initial;
class Active;

// Runs validation, the initial reconciliation and then the live phase on its
// own thread. One interrupt flag is shared with both engines.
class Controller final : public concurrency::AsyncService {
public:
    enum class State {
        IDLE,
        VALIDATING,
        INITIAL_SYNC,
        WATCHING,
        ABORTED,
        FAILED,
        DONE
    };

    struct Options {
        bool watch = true;
        unsigned int workers = 4;
        unsigned int pollIntervalMs = 250;
    };

    using WatcherFactory = std::function<std::shared_ptr<watch::Watcher>(const std::filesystem::path& sourceRoot)>;

    // Roots are expected in normalized absolute form. Without a factory the
    // live phase uses an InotifyWatcher.
    Controller(const std::filesystem::path& source,
               const std::filesystem::path& dest,
               Options options,
               WatcherFactory factory = nullptr);

    ~Controller() override;

    // Idempotent and non-blocking. Forwards to whichever engine is current.
    void abort();

    // Aborts, then joins the controller thread
    void stop() override;

    [[nodiscard]] bool isAborted() const { return abortFlag_->load(); }

    [[nodiscard]] State state() const;

    [[nodiscard]] bool isFinished() const;

    bool waitForState(State state, std::chrono::milliseconds timeout) const;
    bool waitUntilFinished(std::chrono::milliseconds timeout) const;

    [[nodiscard]] std::optional<ValidationError::Kind> validationError() const;
    [[nodiscard]] std::string failureReason() const;

    [[nodiscard]] const std::shared_ptr<model::Report>& report() const { return report_; }
    [[nodiscard]] const fs::model::Path& paths() const { return paths_; }

    // Process exit status for the current state
    [[nodiscard]] int exitCode() const;

protected:
    void runLoop() override;

private:
    void setState(State state);
    void fail(const std::string& reason, std::optional<ValidationError::Kind> kind = std::nullopt);
    bool abortedAt(const char* checkpoint);

    fs::model::Path paths_;
    Options options_;
    WatcherFactory factory_;
    std::shared_ptr<model::Report> report_;
    std::shared_ptr<std::atomic<bool>> abortFlag_;

    mutable std::mutex mutex_;
    mutable std::condition_variable stateCv_;
    State state_ = State::IDLE;
    std::optional<ValidationError::Kind> validationError_;
    std::string failureReason_;

    std::shared_ptr<Initial> initial_;
    std::shared_ptr<Active> active_;
};

std::string to_string(Controller::State state);

// Exit status per validation failure, 2 through 6
int exitCodeFor(ValidationError::Kind kind);

}
