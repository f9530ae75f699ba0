#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ms::paths::setLogPathForTesting();

        ms::config::Config config;
        config.logging.log_dir = ms::paths::getLogPath();
        config.logging.levels.console_log_level = spdlog::level::warn;
        ms::config::ConfigRegistry::init(std::move(config));

        ms::log::Registry::init(ms::config::ConfigRegistry::get().logging.log_dir);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize mirrorsync test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
