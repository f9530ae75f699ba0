#pragma once

#include <filesystem>
#include <sys/stat.h>

namespace ms::fs::ops {

enum class EntryKind {
    NONE,
    FILE,
    DIRECTORY,
    OTHER       // symlinks, devices, sockets, fifos
};

// Side-effect free capability queries. None of these throw.
bool exists(const std::filesystem::path& path) noexcept;
bool isDirectory(const std::filesystem::path& path) noexcept;
bool canRead(const std::filesystem::path& path) noexcept;
bool canWrite(const std::filesystem::path& path) noexcept;

// Classifies the entry itself, without following a trailing symlink
EntryKind kindOf(const std::filesystem::path& path) noexcept;
EntryKind kindOf(const std::filesystem::file_status& status) noexcept;

// stat(2) that follows symlinks; throws std::filesystem::filesystem_error
struct stat statOrThrow(const std::filesystem::path& path);

const char* kindToString(EntryKind kind);

}
