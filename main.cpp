#include "config/ConfigRegistry.hpp"
#include "protocols/ProtocolService.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace ds::config;
using namespace ds::protocols;

namespace {
std::atomic<int> receivedSignal = 0;

void signalHandler(const int signum) {
    receivedSignal = signum;
}

Config resolveConfig(const int argc, char** argv) {
    if (argc > 1) return loadConfig(argv[1]);
    if (!std::filesystem::exists(DEFAULT_CONFIG_PATH)) return Config{};
    return loadConfig(DEFAULT_CONFIG_PATH);
}
}

int main(const int argc, char** argv) {
    try {
        ConfigRegistry::init(resolveConfig(argc, argv));
        ds::log::Registry::init(ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "[diskscout] Failed to initialize: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        ProtocolService service;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        service.start();

        while (receivedSignal == 0 && service.isRunning())
            std::this_thread::sleep_for(std::chrono::milliseconds(250));

        if (receivedSignal != 0)
            ds::log::Registry::diskscout()->info("[!] Signal {} received. Shutting down gracefully...", receivedSignal.load());

        service.stop();
        ds::log::Registry::diskscout()->info("[✓] diskscout stopped");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        ds::log::Registry::diskscout()->critical("[diskscout] Fatal: {}", e.what());
        return EXIT_FAILURE;
    }
}
