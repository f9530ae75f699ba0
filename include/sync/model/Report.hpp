#pragma once

#include "sync/model/Outcome.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace ms::sync::model {

// Thread-safe tally of mirror outcomes, shared by the initial and live phases.
class Report {
public:
    using Observer = std::function<void(const Outcome&)>;

    static constexpr size_t DEFAULT_HISTORY_LIMIT = 4096;

    explicit Report(size_t historyLimit = DEFAULT_HISTORY_LIMIT);

    void record(const Outcome& outcome);

    // Invoked synchronously from whichever thread records an outcome
    void setObserver(Observer observer);

    void start();
    void stop();
    [[nodiscard]] uint64_t duration_ms() const;

    [[nodiscard]] uint64_t copied() const;
    [[nodiscard]] uint64_t skipped() const;
    [[nodiscard]] uint64_t deleted() const;
    [[nodiscard]] uint64_t failed() const;
    [[nodiscard]] uint64_t bytesCopied() const;
    [[nodiscard]] uint64_t total() const;

    // Most recent outcomes, oldest first, bounded by the history limit
    [[nodiscard]] std::vector<Outcome> history() const;

    [[nodiscard]] std::string summary() const;

    void reset();

private:
    mutable std::mutex mutex_;
    Observer observer_;
    size_t historyLimit_;
    std::deque<Outcome> history_;

    uint64_t copied_{}, skipped_{}, deleted_{}, failed_{}, bytes_{};
    std::chrono::steady_clock::time_point begin_{}, end_{};
};

}
