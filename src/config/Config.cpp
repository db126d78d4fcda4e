#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace ds::config {

template <typename T>
static void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error("Invalid configuration section: " + key);
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());
    if (root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Configuration root must be a map: " + path.string());

    decodeSection(root, "websocket_server", cfg.websocket);
    decodeSection(root, "http_server", cfg.http);
    decodeSection(root, "scan", cfg.scan);
    decodeSection(root, "logging", cfg.logging);

    return cfg;
}

}
