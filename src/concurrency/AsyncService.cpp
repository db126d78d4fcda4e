#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace ds::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::diskscout()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::diskscout()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    interruptFlag_.store(true, std::memory_order_release);

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        log::Registry::diskscout()->info("[{}] Stopping service...", serviceName_);
        worker_.join();
        log::Registry::diskscout()->info("[{}] Service stopped.", serviceName_);
    }

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
}

void AsyncService::lazySleep(const std::chrono::milliseconds duration) const {
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + duration;
    while (!shouldStop() && steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::min<milliseconds>(milliseconds(100),
            duration_cast<milliseconds>(deadline - steady_clock::now())));
}
