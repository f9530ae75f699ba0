#include "util/paths.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <unistd.h>

namespace ms::paths {

namespace {
std::optional<std::filesystem::path> configOverride;
std::optional<std::filesystem::path> logOverride;

std::optional<std::filesystem::path> fromEnv(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::filesystem::path(v);
}
}

std::filesystem::path getConfigPath() {
    if (configOverride) return *configOverride;
    if (const auto env = fromEnv(CONFIG_ENV)) return *env;
    return DEFAULT_CONFIG_PATH;
}

std::filesystem::path getLogPath() {
    if (logOverride) return *logOverride;
    if (const auto env = fromEnv(LOG_DIR_ENV)) return *env;
    if (const auto home = fromEnv("HOME")) return *home / ".local" / "state" / "mirrorsync";
    return std::filesystem::temp_directory_path() / "mirrorsync";
}

void setConfigPath(const std::filesystem::path& path) { configOverride = path; }

void setLogPathForTesting() {
    logOverride = std::filesystem::temp_directory_path() / ("mirrorsync_test_logs_" + std::to_string(::getpid()));
}

}
