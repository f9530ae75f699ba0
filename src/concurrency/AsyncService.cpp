#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace ms::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::mirrorsync()->error("[{}] Service error: {}", serviceName_, e.what());
        } catch (...) {
            log::Registry::mirrorsync()->error("[{}] Service error: unknown exception.", serviceName_);
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::mirrorsync()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    interruptFlag_.store(true, std::memory_order_release);

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        log::Registry::mirrorsync()->debug("[{}] Stopping service...", serviceName_);
        worker_.join();
        log::Registry::mirrorsync()->debug("[{}] Service stopped.", serviceName_);
    } else if (worker_.joinable()) {
        worker_.detach();
    }

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
}
