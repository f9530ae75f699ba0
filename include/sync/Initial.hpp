#pragma once

#include "fs/Mirror.hpp"
#include "fs/model/Path.hpp"

#include <atomic>
#include <filesystem>
#include <memory>

namespace ms::sync {

namespace model {
class Report;
}

// Full reconciliation of the destination against the source. Cleanup runs to
// completion before the copy pass starts.
//
// abort() is advisory. It is observed before cleanup, between cleanup and copy,
// and before each top-level source entry of the copy pass. A recursive cleanup
// or directory copy that is already running is never interrupted.
class Initial {
public:
    Initial(fs::model::Path paths,
            std::shared_ptr<model::Report> report,
            std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    void run();

    void abort();

    [[nodiscard]] bool isAborted() const;

    // Deletes destination entries with no source counterpart below destDir
    void cleanup(const std::filesystem::path& destDir) const;

    // Mirrors the top-level source entries onto the destination
    void copy() const;

    [[nodiscard]] const fs::model::Path& paths() const { return paths_; }

private:
    fs::model::Path paths_;
    std::shared_ptr<model::Report> report_;
    fs::Mirror mirror_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
};

}
