#include "sync/model/Report.hpp"

#include <fmt/core.h>

using namespace ms::sync::model;
using namespace std::chrono;

Report::Report(const size_t historyLimit) : historyLimit_(historyLimit) {}

void Report::record(const Outcome& outcome) {
    Observer observer;
    {
        std::scoped_lock lock(mutex_);
        switch (outcome.status) {
        case Outcome::Status::COPIED:
            ++copied_;
            bytes_ += outcome.size_bytes;
            break;
        case Outcome::Status::SKIPPED: ++skipped_; break;
        case Outcome::Status::DELETED: ++deleted_; break;
        case Outcome::Status::ERROR: ++failed_; break;
        }

        if (historyLimit_ > 0) {
            if (history_.size() == historyLimit_) history_.pop_front();
            history_.push_back(outcome);
        }
        observer = observer_;
    }

    if (observer) observer(outcome);
}

void Report::setObserver(Observer observer) {
    std::scoped_lock lock(mutex_);
    observer_ = std::move(observer);
}

void Report::start() {
    std::scoped_lock lock(mutex_);
    begin_ = end_ = steady_clock::now();
}

void Report::stop() {
    std::scoped_lock lock(mutex_);
    end_ = steady_clock::now();
}

uint64_t Report::duration_ms() const {
    std::scoped_lock lock(mutex_);
    return duration_cast<milliseconds>(end_ - begin_).count();
}

uint64_t Report::copied() const { std::scoped_lock lock(mutex_); return copied_; }
uint64_t Report::skipped() const { std::scoped_lock lock(mutex_); return skipped_; }
uint64_t Report::deleted() const { std::scoped_lock lock(mutex_); return deleted_; }
uint64_t Report::failed() const { std::scoped_lock lock(mutex_); return failed_; }
uint64_t Report::bytesCopied() const { std::scoped_lock lock(mutex_); return bytes_; }

uint64_t Report::total() const {
    std::scoped_lock lock(mutex_);
    return copied_ + skipped_ + deleted_ + failed_;
}

std::vector<Outcome> Report::history() const {
    std::scoped_lock lock(mutex_);
    return {history_.begin(), history_.end()};
}

std::string Report::summary() const {
    const auto elapsed = duration_ms();
    std::scoped_lock lock(mutex_);
    return fmt::format("{} copied ({} bytes), {} unchanged or skipped, {} deleted, {} failed in {}ms",
                       copied_, bytes_, skipped_, deleted_, failed_, elapsed);
}

void Report::reset() {
    std::scoped_lock lock(mutex_);
    copied_ = skipped_ = deleted_ = failed_ = bytes_ = 0;
    history_.clear();
    begin_ = end_ = {};
}
