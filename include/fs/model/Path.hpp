#pragma once

#include <filesystem>
#include <string>

namespace ms::fs::model {

enum class PathType {
    SOURCE_ROOT,
    DEST_ROOT
};

// Relative Path Mapping between the two configured roots. Translation is pure
// prefix substitution; a path that does not start with the expected root is a
// caller bug and raises std::invalid_argument.
struct Path {
    const std::filesystem::path sourceRoot, destRoot;

    explicit Path(const std::filesystem::path& source, const std::filesystem::path& dest);

    [[nodiscard]] const std::filesystem::path& root(const PathType& type) const;

    [[nodiscard]] std::filesystem::path absPath(const std::filesystem::path& relPath, const PathType& type) const;
    [[nodiscard]] std::filesystem::path relPath(const std::filesystem::path& absPath, const PathType& type) const;

    /// Rewrites the root prefix of `path` from one side to the other, keeping the relative part verbatim.
    /// e.g. translate("/data/in/sub/b.txt", SOURCE_ROOT, DEST_ROOT) with roots /data/in and /backup
    /// returns "/backup/sub/b.txt"
    [[nodiscard]] std::filesystem::path translate(const std::filesystem::path& path, const PathType& from, const PathType& to) const;

    [[nodiscard]] std::filesystem::path toDest(const std::filesystem::path& sourcePath) const {
        return translate(sourcePath, PathType::SOURCE_ROOT, PathType::DEST_ROOT);
    }

    [[nodiscard]] std::filesystem::path toSource(const std::filesystem::path& destPath) const {
        return translate(destPath, PathType::DEST_ROOT, PathType::SOURCE_ROOT);
    }
};

inline std::filesystem::path stripLeadingSlash(const std::filesystem::path& path) {
    if (path.empty()) return {};
    auto str = path.string();
    const auto pos = str.find_first_not_of('/');
    if (pos == std::string::npos) return {};
    return {str.substr(pos)};
}

inline std::filesystem::path stripTrailingSlash(const std::filesystem::path& path) {
    auto str = path.string();
    while (str.size() > 1 && str.back() == '/') str.pop_back();
    return {str};
}

// Absolute, lexically normal, no trailing separator. Does not touch the filesystem.
inline std::filesystem::path normalizeRoot(const std::filesystem::path& input) {
    auto p = input.is_absolute() ? input : std::filesystem::current_path() / input;
    return stripTrailingSlash(p.lexically_normal());
}

inline std::string pathTypeToString(const PathType& type) {
    return type == PathType::SOURCE_ROOT ? "source" : "destination";
}

}
