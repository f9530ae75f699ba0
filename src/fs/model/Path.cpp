#include "fs/model/Path.hpp"

#include <stdexcept>

using namespace ms::fs::model;

Path::Path(const std::filesystem::path& source, const std::filesystem::path& dest)
    : sourceRoot(stripTrailingSlash(source)),
      destRoot(stripTrailingSlash(dest)) {}

const std::filesystem::path& Path::root(const PathType& type) const {
    switch (type) {
    case PathType::SOURCE_ROOT: return sourceRoot;
    case PathType::DEST_ROOT: return destRoot;
    default:
        throw std::invalid_argument("Invalid PathType");
    }
}

std::filesystem::path Path::absPath(const std::filesystem::path& relPath, const PathType& type) const {
    const auto rel = stripLeadingSlash(relPath);
    if (rel.empty()) return root(type);
    return root(type) / rel;
}

std::filesystem::path Path::relPath(const std::filesystem::path& absPath, const PathType& type) const {
    const auto& base = root(type).string();
    const auto& input = absPath.string();

    if (input == base) return {};

    // "/" as a root matches every absolute path
    const auto prefix = base == "/" ? base : base + "/";
    if (input.compare(0, prefix.size(), prefix) != 0)
        throw std::invalid_argument("Path '" + input + "' is not under the " + pathTypeToString(type) + " root '" + base + "'");

    return {input.substr(prefix.size())};
}

std::filesystem::path Path::translate(const std::filesystem::path& path, const PathType& from, const PathType& to) const {
    return absPath(relPath(path, from), to);
}
