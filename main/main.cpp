#include "cli/Args.hpp"
#include "cli/Signals.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "sync/Controller.hpp"
#include "sync/model/Report.hpp"
#include "util/paths.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>

using namespace ms::cli;
using namespace ms::config;
using namespace ms::sync;

int main(const int argc, char** argv) {
    Args args;
    try {
        args = parseArgs(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << usage(argv[0]);
        return EXIT_USAGE;
    }

    if (args.help) {
        std::cout << usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try {
        if (args.configPath) ms::paths::setConfigPath(*args.configPath);
        ConfigRegistry::init();
        ms::log::Registry::init(ConfigRegistry::get().logging.log_dir);
        if (args.verbose) ms::log::Registry::enableVerbose();
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to initialize mirrorsync: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        const auto& config = ConfigRegistry::get();

        ms::log::Registry::mirrorsync()->info("[*] Syncing {} with {}", args.source.string(), args.destination.string());

        Controller::Options options;
        options.watch = config.sync.watch && !args.once;
        options.workers = config.sync.worker_threads;
        options.pollIntervalMs = config.watch.poll_interval_ms;

        installShutdownHandlers();

        Controller controller(args.source, args.destination, options);
        controller.start();

        while (!shutdownRequested() && !controller.waitUntilFinished(std::chrono::milliseconds(200))) {}

        if (shutdownRequested()) ms::log::Registry::mirrorsync()->info("[!] Signal received. Shutting down gracefully...");
        controller.stop();

        const auto state = controller.state();
        if (state == Controller::State::FAILED) {
            std::cerr << "[-] " << controller.failureReason() << std::endl;
        } else {
            ms::log::Registry::mirrorsync()->info("[✓] mirrorsync {} ({})", to_string(state), controller.report()->summary());
        }

        return controller.exitCode();
    } catch (const std::exception& e) {
        ms::log::Registry::mirrorsync()->error("[-] mirrorsync failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
