#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace ds::config {

constexpr static uintmax_t MAX_MESSAGE_SIZE_BYTES = 64 * 1024; // 64KB

struct WebsocketConfig {
    bool enabled = true;
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    uintmax_t max_message_bytes = MAX_MESSAGE_SIZE_BYTES;
};

struct HttpConfig {
    bool enabled = true;
    std::string host = "0.0.0.0";
    uint16_t port = 3001;
};

struct ScanConfig {
    unsigned int default_depth = 2;
    unsigned int max_depth = 16;        // recursion is native, keep it bounded
    unsigned int worker_threads = 0;    // 0 = hardware concurrency
    unsigned int progress_interval = 50;
    unsigned int top_n = 20;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum diskscout = spdlog::level::info;   // Startup/shutdown, service lifecycle
    spdlog::level::level_enum scan      = spdlog::level::info;   // Task start/finish, per-entry failures at debug
    spdlog::level::level_enum websocket = spdlog::level::warn;   // Closed sockets, malformed frames
    spdlog::level::level_enum http      = spdlog::level::warn;   // 4xx/5xx
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    WebsocketConfig websocket;
    HttpConfig http;
    ScanConfig scan;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

}
