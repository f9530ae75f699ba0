#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace ms::sync::model {

struct Outcome {
    enum class Status {
        COPIED,
        SKIPPED,
        DELETED,
        ERROR
    };

    Status status{Status::SKIPPED};
    std::filesystem::path path{};
    std::string reason{};
    uint64_t size_bytes{};

    static Outcome copied(const std::filesystem::path& p, const uint64_t bytes) { return {Status::COPIED, p, {}, bytes}; }
    static Outcome skipped(const std::filesystem::path& p, std::string why) { return {Status::SKIPPED, p, std::move(why), 0}; }
    static Outcome deleted(const std::filesystem::path& p) { return {Status::DELETED, p, {}, 0}; }
    static Outcome error(const std::filesystem::path& p, std::string why) { return {Status::ERROR, p, std::move(why), 0}; }

    [[nodiscard]] std::string statusToString() const;
};

std::string to_string(Outcome::Status status);

}
