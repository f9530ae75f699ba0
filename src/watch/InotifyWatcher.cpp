#include "watch/InotifyWatcher.hpp"
#include "watch/Listener.hpp"
#include "fs/ops/probe.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <sys/inotify.h>
#include <system_error>
#include <unistd.h>

using namespace ms::watch;
using namespace ms::fs::ops;

namespace {

constexpr uint32_t WATCH_MASK = IN_CREATE | IN_MOVED_TO | IN_CLOSE_WRITE | IN_ATTRIB
                              | IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF
                              | IN_ONLYDIR | IN_DONT_FOLLOW;

constexpr size_t EVENT_BUFFER_SIZE = 64 * 1024;

bool isUnder(const std::string& path, const std::string& dir) {
    return path == dir || (path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/');
}

}

InotifyWatcher::InotifyWatcher(std::filesystem::path root, const unsigned int pollIntervalMs)
    : AsyncService("InotifyWatcher"),
      root_(std::move(root)),
      pollIntervalMs_(pollIntervalMs == 0 ? 1 : pollIntervalMs) {}

InotifyWatcher::~InotifyWatcher() {
    close();
}

void InotifyWatcher::watch(Listener& listener) {
    std::scoped_lock lock(lifecycleMutex_);
    if (closed_.load()) {
        log::Registry::watch()->debug("[InotifyWatcher] Ignoring watch() on closed {}", root_.string());
        return;
    }
    if (isRunning()) throw std::logic_error("InotifyWatcher: already watching " + root_.string());

    fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) throw std::system_error(errno, std::generic_category(), "inotify_init1");

    listener_ = &listener;
    start();
}

void InotifyWatcher::close() {
    std::scoped_lock lock(lifecycleMutex_);
    if (closed_.exchange(true)) return;
    stop();
    log::Registry::watch()->debug("[InotifyWatcher] Closed watch on {}", root_.string());
}

size_t InotifyWatcher::watchCount() const {
    std::scoped_lock lock(watchMutex_);
    return watches_.size();
}

std::optional<std::string> InotifyWatcher::failure() const {
    std::scoped_lock lock(failureMutex_);
    return failure_;
}

void InotifyWatcher::runLoop() {
    try {
        readEvents();
    } catch (const std::exception& e) {
        {
            std::scoped_lock lock(failureMutex_);
            failure_ = e.what();
        }
        throw;
    }
}

void InotifyWatcher::readEvents() {
    struct FdGuard {
        int& fd;
        ~FdGuard() {
            if (fd >= 0) ::close(fd);
            fd = -1;
        }
    } guard{fd_};

    addWatchTree(root_, true);
    log::Registry::watch()->info("[InotifyWatcher] Initial scan of {} complete ({} directories)", root_.string(), watchCount());
    emit([](Listener& l) { l.onReady(); });

    alignas(struct inotify_event) char buffer[EVENT_BUFFER_SIZE];

    while (!interruptFlag_.load() && !closed_.load()) {
        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(pollIntervalMs_));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (ready == 0) continue;

        const ssize_t len = ::read(fd_, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "read(inotify)");
        }

        for (ssize_t offset = 0; offset < len;) {
            const auto* ev = reinterpret_cast<const struct inotify_event*>(buffer + offset);
            handle(ev->wd, ev->mask, ev->len > 0 ? ev->name : nullptr);
            offset += static_cast<ssize_t>(sizeof(struct inotify_event) + ev->len);
        }
    }

    std::scoped_lock lock(watchMutex_);
    watches_.clear();
}

void InotifyWatcher::addWatchTree(const std::filesystem::path& dir, const bool report) {
    const int wd = ::inotify_add_watch(fd_, dir.c_str(), WATCH_MASK);
    if (wd < 0) {
        // Unreadable or vanished directories are skipped, like any other permission error
        log::Registry::watch()->warn("[InotifyWatcher] Unable to watch {}: {}", dir.string(), std::strerror(errno));
        return;
    }

    {
        std::scoped_lock lock(watchMutex_);
        watches_[wd] = dir;
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec), end;
    if (ec) {
        log::Registry::watch()->warn("[InotifyWatcher] Unable to list {}: {}", dir.string(), ec.message());
        return;
    }

    for (; it != end; it.increment(ec)) {
        if (ec) break;
        const auto path = it->path();
        switch (kindOf(it->symlink_status())) {
        case EntryKind::DIRECTORY:
            if (report) emit([&](Listener& l) { l.onAddedDirectory(path); });
            addWatchTree(path, report);
            break;
        case EntryKind::FILE:
            if (report) emit([&](Listener& l) { l.onAdded(path); });
            break;
        default:
            break;
        }
    }

    if (ec) log::Registry::watch()->warn("[InotifyWatcher] Listing of {} interrupted: {}", dir.string(), ec.message());
}

void InotifyWatcher::dropWatchTree(const std::filesystem::path& dir) {
    std::scoped_lock lock(watchMutex_);
    const auto prefix = dir.string();
    for (auto it = watches_.begin(); it != watches_.end();) {
        if (isUnder(it->second.string(), prefix)) {
            // Fails with EINVAL once the kernel already dropped it; nothing to undo then
            if (::inotify_rm_watch(fd_, it->first) != 0 && errno != EINVAL)
                log::Registry::watch()->debug("[InotifyWatcher] inotify_rm_watch({}) failed: {}", it->second.string(), std::strerror(errno));
            it = watches_.erase(it);
        } else ++it;
    }
}

void InotifyWatcher::handle(const int wd, const uint32_t mask, const char* name) {
    if (mask & IN_Q_OVERFLOW) {
        log::Registry::watch()->warn("[InotifyWatcher] Event queue overflow on {}, changes were lost", root_.string());
        return;
    }

    std::filesystem::path dir;
    {
        std::scoped_lock lock(watchMutex_);
        const auto it = watches_.find(wd);
        if (it == watches_.end()) return;
        dir = it->second;
        if (mask & IN_IGNORED) {
            watches_.erase(it);
            return;
        }
    }

    if (mask & IN_DELETE_SELF) {
        if (dir == root_) log::Registry::watch()->warn("[InotifyWatcher] Watched root {} was removed", root_.string());
        return;
    }

    if (!name) return;
    const auto path = dir / name;
    const bool isDir = mask & IN_ISDIR;

    if (mask & (IN_CREATE | IN_MOVED_TO)) {
        if (isDir) {
            addWatchTree(path, false);
            emit([&](Listener& l) { l.onAddedDirectory(path); });
        } else if (kindOf(path) == EntryKind::FILE) {
            emit([&](Listener& l) { l.onAdded(path); });
        }
        return;
    }

    if (mask & (IN_CLOSE_WRITE | IN_ATTRIB)) {
        if (!isDir && kindOf(path) == EntryKind::FILE) emit([&](Listener& l) { l.onChanged(path); });
        return;
    }

    if (mask & (IN_DELETE | IN_MOVED_FROM)) {
        if (isDir) {
            dropWatchTree(path);
            emit([&](Listener& l) { l.onRemovedDirectory(path); });
        } else {
            emit([&](Listener& l) { l.onRemoved(path); });
        }
    }
}
