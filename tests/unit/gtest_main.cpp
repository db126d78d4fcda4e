#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ds::config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        cfg.logging.levels.subsystem_levels.scan = spdlog::level::warn;
        ds::config::ConfigRegistry::init(cfg);
        ds::log::Registry::init(ds::config::ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize diskscout test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
