#include "cli/Signals.hpp"

#include <atomic>
#include <csignal>

namespace {
std::atomic shouldExit = false;

void signalHandler(const int signum) {
    shouldExit = true;
    std::signal(signum, SIG_DFL);
}
}

namespace ms::cli {

void installShutdownHandlers() {
    shouldExit = false;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

bool shutdownRequested() {
    return shouldExit.load();
}

}
