#pragma once

#include <filesystem>

namespace ms::paths {

static constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/mirrorsync/config.yaml";
static constexpr const auto* CONFIG_ENV = "MIRRORSYNC_CONFIG";
static constexpr const auto* LOG_DIR_ENV = "MIRRORSYNC_LOG_DIR";

std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();

void setConfigPath(const std::filesystem::path& path);

// Routes logs into a per-process temp directory
void setLogPathForTesting();

}
