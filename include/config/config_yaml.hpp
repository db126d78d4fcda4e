#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ds::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<WebsocketConfig> {
    static Node encode(const WebsocketConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["max_message_kb"] = rhs.max_message_bytes / 1024;
        return node;
    }

    static bool decode(const Node& node, WebsocketConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(3000);
        rhs.max_message_bytes = node["max_message_kb"].as<uintmax_t>(64) * 1024;
        return true;
    }
};

template<>
struct convert<HttpConfig> {
    static Node encode(const HttpConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        return node;
    }

    static bool decode(const Node& node, HttpConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(3001);
        return true;
    }
};

template<>
struct convert<ScanConfig> {
    static Node encode(const ScanConfig& rhs) {
        Node node;
        node["default_depth"] = rhs.default_depth;
        node["max_depth"] = rhs.max_depth;
        node["worker_threads"] = rhs.worker_threads;
        node["progress_interval"] = rhs.progress_interval;
        node["top_n"] = rhs.top_n;
        return node;
    }

    static bool decode(const Node& node, ScanConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_depth = node["default_depth"].as<unsigned int>(2);
        rhs.max_depth = node["max_depth"].as<unsigned int>(16);
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(0);
        rhs.progress_interval = node["progress_interval"].as<unsigned int>(50);
        rhs.top_n = node["top_n"].as<unsigned int>(20);
        if (rhs.default_depth == 0 || rhs.max_depth == 0 || rhs.progress_interval == 0) return false;
        if (rhs.default_depth > rhs.max_depth) return false;
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["diskscout"] = to_std_string(spdlog::level::to_string_view(rhs.diskscout));
        node["scan"]      = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["websocket"] = to_std_string(spdlog::level::to_string_view(rhs.websocket));
        node["http"]      = to_std_string(spdlog::level::to_string_view(rhs.http));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.diskscout = spdlog::level::from_str(node["diskscout"].as<std::string>("info"));
        rhs.scan = spdlog::level::from_str(node["scan"].as<std::string>("info"));
        rhs.websocket = spdlog::level::from_str(node["websocket"].as<std::string>("warn"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"])
            rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"])
            rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
