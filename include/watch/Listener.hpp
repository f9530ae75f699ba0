#pragma once

#include <filesystem>

namespace ms::watch {

// Receives change notifications for entries below a watched root. Paths are
// absolute and start with the root the watcher was created for.
class Listener {
public:
    virtual ~Listener() = default;

    virtual void onAdded(const std::filesystem::path& path) = 0;
    virtual void onAddedDirectory(const std::filesystem::path& path) = 0;
    virtual void onChanged(const std::filesystem::path& path) = 0;
    virtual void onRemoved(const std::filesystem::path& path) = 0;
    virtual void onRemovedDirectory(const std::filesystem::path& path) = 0;

    // Fired exactly once, after every pre-existing entry has been reported
    virtual void onReady() = 0;
};

}
