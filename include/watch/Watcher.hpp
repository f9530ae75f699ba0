#pragma once

#include <optional>
#include <string>

namespace ms::watch {

class Listener;

// Change notification capability for one root directory.
//
// After watch() the implementation reports every pre-existing entry, then
// calls onReady() once, then reports live changes. No ordering is guaranteed
// across paths. Removing a directory may or may not produce removal events for
// its descendants.
class Watcher {
public:
    virtual ~Watcher() = default;

    // The listener must outlive the watch session
    virtual void watch(Listener& listener) = 0;

    // Stops dispatch. No callback starts after close() returns.
    virtual void close() = 0;

    [[nodiscard]] virtual bool isClosed() const = 0;

    // Set when the session ended on its own; no further events will arrive
    [[nodiscard]] virtual std::optional<std::string> failure() const { return std::nullopt; }
};

}
