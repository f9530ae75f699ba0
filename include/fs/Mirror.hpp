#pragma once

#include "sync/model/Outcome.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>

namespace ms::sync::model {
class Report;
}

namespace ms::fs {

// Rounded absolute difference of two modification times, in milliseconds.
// Rounds half up like the classic Math.round, so only |delta| < 0.5ms maps to 0.
int64_t mtimeDeltaMs(const std::timespec& a, const std::timespec& b);

// Copy and delete primitives shared by both sync phases. Every operation
// returns its outcome and, when a report is attached, records it.
// Low-level failures are not caught here and surface as std::filesystem::filesystem_error.
class Mirror {
public:
    explicit Mirror(std::shared_ptr<sync::model::Report> report = nullptr);

    // No-op when the destination exists with an equal modification time.
    // Otherwise copies content and stamps atime/mtime from the source.
    sync::model::Outcome copyFile(const std::filesystem::path& source, const std::filesystem::path& dest) const;

    // Recursively mirrors files and directories below source. Other entry kinds are ignored.
    sync::model::Outcome copyDirectory(const std::filesystem::path& source, const std::filesystem::path& dest) const;

    sync::model::Outcome removeFile(const std::filesystem::path& dest) const;
    sync::model::Outcome removeDirectory(const std::filesystem::path& dest) const;

    // Creates the directory chain when nothing exists at dir yet
    static void ensureDir(const std::filesystem::path& dir);

    [[nodiscard]] static bool isUnchanged(const std::filesystem::path& source, const std::filesystem::path& dest);

    [[nodiscard]] const std::shared_ptr<sync::model::Report>& report() const { return report_; }

private:
    sync::model::Outcome record(sync::model::Outcome outcome) const;

    std::shared_ptr<sync::model::Report> report_;
};

}
