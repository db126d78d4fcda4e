#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace ds::config {

inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/diskscout/config.yaml";

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
    static void init(Config config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace ds::config
