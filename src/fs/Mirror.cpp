#include "fs/Mirror.hpp"
#include "fs/ops/probe.hpp"
#include "sync/model/Report.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>

using namespace ms::fs;
using namespace ms::fs::ops;
using namespace ms::sync::model;

namespace ms::fs {

int64_t mtimeDeltaMs(const std::timespec& a, const std::timespec& b) {
    const int64_t deltaNs = (static_cast<int64_t>(a.tv_sec) - b.tv_sec) * 1'000'000'000LL
                          + (static_cast<int64_t>(a.tv_nsec) - b.tv_nsec);
    const auto rounded = static_cast<int64_t>(std::floor(static_cast<double>(deltaNs) / 1e6 + 0.5));
    return std::llabs(rounded);
}

}

Mirror::Mirror(std::shared_ptr<Report> report) : report_(std::move(report)) {}

Outcome Mirror::record(Outcome outcome) const {
    if (report_) report_->record(outcome);
    return outcome;
}

void Mirror::ensureDir(const std::filesystem::path& dir) {
    if (dir.empty() || ops::exists(dir)) return;
    std::filesystem::create_directories(dir);
}

bool Mirror::isUnchanged(const std::filesystem::path& source, const std::filesystem::path& dest) {
    const auto src = statOrThrow(source);
    const auto dst = statOrThrow(dest);
    return mtimeDeltaMs(src.st_mtim, dst.st_mtim) == 0;
}

Outcome Mirror::copyFile(const std::filesystem::path& source, const std::filesystem::path& dest) const {
    ensureDir(dest.parent_path());

    if (ops::exists(dest) && isUnchanged(source, dest)) {
        log::Registry::fs()->trace("[Mirror] Unchanged, skipping {}", source.string());
        return record(Outcome::skipped(dest, "unchanged"));
    }

    std::filesystem::copy_file(source, dest, std::filesystem::copy_options::overwrite_existing);

    // Stamp the destination with the source times so the next comparison is exact
    const auto st = statOrThrow(source);
    const std::timespec times[2] = {st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, dest.c_str(), times, 0) != 0)
        throw std::filesystem::filesystem_error("utimensat", dest, std::error_code(errno, std::generic_category()));

    log::Registry::fs()->debug("[Mirror] Copied {} -> {} ({} bytes)", source.string(), dest.string(), st.st_size);
    return record(Outcome::copied(dest, static_cast<uint64_t>(st.st_size)));
}

Outcome Mirror::copyDirectory(const std::filesystem::path& source, const std::filesystem::path& dest) const {
    ensureDir(dest);

    bool changed = false;
    uint64_t bytes = 0;

    for (const auto& entry : std::filesystem::directory_iterator(source)) {
        const auto target = dest / entry.path().filename();

        Outcome outcome;
        switch (kindOf(entry.symlink_status())) {
        case EntryKind::DIRECTORY:
            outcome = copyDirectory(entry.path(), target);
            break;
        case EntryKind::FILE:
            outcome = copyFile(entry.path(), target);
            break;
        default:
            log::Registry::fs()->debug("[Mirror] Ignoring non-regular entry {}", entry.path().string());
            continue;
        }

        if (outcome.status == Outcome::Status::COPIED) {
            changed = true;
            bytes += outcome.size_bytes;
        }
    }

    return changed ? Outcome::copied(dest, bytes) : Outcome::skipped(dest, "unchanged");
}

Outcome Mirror::removeFile(const std::filesystem::path& dest) const {
    std::filesystem::remove(dest);
    log::Registry::fs()->debug("[Mirror] Deleted file {}", dest.string());
    return record(Outcome::deleted(dest));
}

Outcome Mirror::removeDirectory(const std::filesystem::path& dest) const {
    const auto count = std::filesystem::remove_all(dest);
    log::Registry::fs()->debug("[Mirror] Deleted directory {} ({} entries)", dest.string(), count);
    return record(Outcome::deleted(dest));
}
