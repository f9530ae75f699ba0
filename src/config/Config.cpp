#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/paths.hpp"

#include <yaml-cpp/yaml.h>

namespace ms::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;

    if (root.IsMap()) {
        if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
        if (auto node = root["watch"]) YAML::convert<WatchConfig>::decode(node, cfg.watch);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    } else if (!root.IsNull()) {
        throw YAML::ParserException(root.Mark(), "configuration root must be a mapping");
    }

    if (cfg.logging.log_dir.empty()) cfg.logging.log_dir = paths::getLogPath();
    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return fromRoot(YAML::Node());
    return fromRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

}
