#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace ms::sync {

class ValidationError : public std::runtime_error {
public:
    enum class Kind {
        SOURCE_MISSING,
        SOURCE_UNREADABLE,
        DEST_TYPE_MISMATCH,
        DEST_UNWRITABLE,
        DEST_UNCREATABLE
    };

    ValidationError(Kind kind, const std::string& message);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    // Stable identifier, e.g. "E_IN_DIR_ERROR"
    [[nodiscard]] const char* code() const noexcept;

private:
    Kind kind_;
};

std::string to_string(ValidationError::Kind kind);

// Source must be an existing, readable directory
void assertSource(const std::filesystem::path& source);

// Destination is created when absent; when present it must be a writable directory
void assertDestination(const std::filesystem::path& dest);

}
