#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace ms::config {

struct SyncConfig {
    unsigned int worker_threads = 4;    // live-phase event workers
    bool watch = true;                  // false stops after the initial reconciliation
};

struct WatchConfig {
    unsigned int poll_interval_ms = 250;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mirrorsync = spdlog::level::info;   // Startup, phase transitions, shutdown
    spdlog::level::level_enum fs         = spdlog::level::info;   // Copies and deletions
    spdlog::level::level_enum sync       = spdlog::level::info;   // Engine decisions and summaries
    spdlog::level::level_enum watch      = spdlog::level::warn;   // Watch registration, queue overflows
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;
    LogLevelsConfig levels;
};

struct Config {
    SyncConfig sync;
    WatchConfig watch;
    LoggingConfig logging;
};

// Missing file yields defaults; a malformed file throws YAML::Exception
Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

}
