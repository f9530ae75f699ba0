#include "sync/Validator.hpp"
#include "fs/ops/probe.hpp"
#include "log/Registry.hpp"

#include <system_error>
#include <unistd.h>

using namespace ms::fs::ops;

namespace ms::sync {

ValidationError::ValidationError(const Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

const char* ValidationError::code() const noexcept {
    switch (kind_) {
    case Kind::SOURCE_MISSING: return "E_IN_DIR_ERROR";
    case Kind::SOURCE_UNREADABLE: return "E_IN_DIR_ACCESS";
    case Kind::DEST_TYPE_MISMATCH: return "E_OUT_MISMATCH";
    case Kind::DEST_UNWRITABLE: return "E_OUT_DIR_ACCESS";
    case Kind::DEST_UNCREATABLE: return "E_OUT_DIR_CREATE";
    }
    return "E_UNKNOWN";
}

std::string to_string(const ValidationError::Kind kind) {
    switch (kind) {
    case ValidationError::Kind::SOURCE_MISSING: return "source-missing";
    case ValidationError::Kind::SOURCE_UNREADABLE: return "source-unreadable";
    case ValidationError::Kind::DEST_TYPE_MISMATCH: return "destination-type-mismatch";
    case ValidationError::Kind::DEST_UNWRITABLE: return "destination-unwritable";
    case ValidationError::Kind::DEST_UNCREATABLE: return "destination-uncreatable";
    }
    return "unknown";
}

void assertSource(const std::filesystem::path& source) {
    if (!isDirectory(source))
        throw ValidationError(ValidationError::Kind::SOURCE_MISSING,
                              "The source directory does not exist or the current user has no read access to it: " + source.string());

    if (::access(source.c_str(), R_OK) != 0)
        throw ValidationError(ValidationError::Kind::SOURCE_UNREADABLE,
                              "The current user has no read access to the source directory: " + source.string());
}

void assertDestination(const std::filesystem::path& dest) {
    if (!fs::ops::exists(dest)) {
        std::error_code ec;
        std::filesystem::create_directories(dest, ec);
        if (ec)
            throw ValidationError(ValidationError::Kind::DEST_UNCREATABLE,
                                  "Unable to create the destination directory " + dest.string() + ": " + ec.message());
        log::Registry::sync()->info("[Validator] Created destination directory {}", dest.string());
        return;
    }

    if (!isDirectory(dest))
        throw ValidationError(ValidationError::Kind::DEST_TYPE_MISMATCH,
                              "The destination path exists but it is not a directory: " + dest.string());

    if (::access(dest.c_str(), R_OK | W_OK) != 0)
        throw ValidationError(ValidationError::Kind::DEST_UNWRITABLE,
                              "Unable to write to the destination directory: " + dest.string());
}

}
