#include "sync/Initial.hpp"
#include "sync/model/Report.hpp"
#include "fs/ops/probe.hpp"
#include "log/Registry.hpp"

#include <vector>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::fs;
using namespace ms::fs::ops;
using namespace ms::fs::model;

namespace {

struct Listing {
    std::filesystem::path path;
    EntryKind kind;
};

// Snapshot first so deletions never race the directory stream
std::vector<Listing> list(const std::filesystem::path& dir) {
    std::vector<Listing> out;
    for (const auto& entry : std::filesystem::directory_iterator(dir))
        out.push_back({entry.path(), kindOf(entry.symlink_status())});
    return out;
}

}

Initial::Initial(Path paths, std::shared_ptr<Report> report, std::shared_ptr<std::atomic<bool>> interruptFlag)
    : paths_(std::move(paths)),
      report_(report ? std::move(report) : std::make_shared<Report>()),
      mirror_(report_),
      interruptFlag_(interruptFlag ? std::move(interruptFlag) : std::make_shared<std::atomic<bool>>(false)) {}

void Initial::abort() { interruptFlag_->store(true); }

bool Initial::isAborted() const { return interruptFlag_->load(); }

void Initial::run() {
    if (isAborted()) {
        log::Registry::sync()->info("[Initial] Aborted before start");
        return;
    }

    report_->start();
    log::Registry::sync()->debug("[Initial] Cleaning up {}", paths_.destRoot.string());
    cleanup(paths_.destRoot);

    if (isAborted()) {
        report_->stop();
        log::Registry::sync()->info("[Initial] Aborted after cleanup");
        return;
    }

    log::Registry::sync()->debug("[Initial] Copying {} -> {}", paths_.sourceRoot.string(), paths_.destRoot.string());
    copy();
    report_->stop();

    log::Registry::sync()->info("[Initial] Reconciled {}: {}", paths_.destRoot.string(), report_->summary());
}

void Initial::cleanup(const std::filesystem::path& destDir) const {
    for (const auto& [target, kind] : list(destDir)) {
        const auto src = paths_.toSource(target);
        const bool sourceExists = fs::ops::exists(src);

        // Only the destination side's type is consulted. A file shadowing a
        // source directory of the same name is kept.
        if (sourceExists && kind == EntryKind::FILE) continue;

        if (sourceExists && kind == EntryKind::DIRECTORY) {
            cleanup(target);
            continue;
        }

        if (kind == EntryKind::DIRECTORY) mirror_.removeDirectory(target);
        else if (kind == EntryKind::FILE) mirror_.removeFile(target);
        else log::Registry::sync()->debug("[Initial] Leaving non-regular entry {}", target.string());
    }
}

void Initial::copy() const {
    for (const auto& [src, kind] : list(paths_.sourceRoot)) {
        if (isAborted()) {
            log::Registry::sync()->info("[Initial] Aborted, not copying remaining entries");
            return;
        }

        const auto target = paths_.toDest(src);
        if (kind == EntryKind::DIRECTORY) mirror_.copyDirectory(src, target);
        else if (kind == EntryKind::FILE) mirror_.copyFile(src, target);
    }
}
