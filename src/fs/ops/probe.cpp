#include "fs/ops/probe.hpp"

#include <cerrno>
#include <system_error>
#include <unistd.h>

namespace ms::fs::ops {

bool exists(const std::filesystem::path& path) noexcept {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

bool isDirectory(const std::filesystem::path& path) noexcept {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool canRead(const std::filesystem::path& path) noexcept {
    if (!ops::exists(path)) return false;
    return ::access(path.c_str(), R_OK) == 0;
}

bool canWrite(const std::filesystem::path& path) noexcept {
    if (!ops::exists(path)) return false;
    return ::access(path.c_str(), W_OK) == 0;
}

EntryKind kindOf(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec) return EntryKind::NONE;
    return kindOf(status);
}

EntryKind kindOf(const std::filesystem::file_status& status) noexcept {
    switch (status.type()) {
    case std::filesystem::file_type::regular: return EntryKind::FILE;
    case std::filesystem::file_type::directory: return EntryKind::DIRECTORY;
    case std::filesystem::file_type::not_found:
    case std::filesystem::file_type::none: return EntryKind::NONE;
    default: return EntryKind::OTHER;
    }
}

struct stat statOrThrow(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
        throw std::filesystem::filesystem_error("stat", path, std::error_code(errno, std::generic_category()));
    return st;
}

const char* kindToString(const EntryKind kind) {
    switch (kind) {
    case EntryKind::NONE: return "none";
    case EntryKind::FILE: return "file";
    case EntryKind::DIRECTORY: return "directory";
    case EntryKind::OTHER: return "other";
    }
    return "unknown";
}

}
