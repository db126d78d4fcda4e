#include "scan/ProgressPublisher.hpp"
#include "scan/Channel.hpp"
#include "scan/model/Progress.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace ds::scan;

ProgressPublisher::ProgressPublisher(std::weak_ptr<Channel> channel) : channel_(std::move(channel)) {}

nlohmann::json ProgressPublisher::envelope(const std::string& type, const nlohmann::json& payload) {
    return {{"type", type}, {"payload", payload}};
}

std::string ProgressPublisher::serialize(const std::string& type, const nlohmann::json& payload) {
    // file names on Linux are bytes, not UTF-8
    return envelope(type, payload).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool ProgressPublisher::isConnected() const {
    const auto channel = channel_.lock();
    return channel && channel->isOpen();
}

bool ProgressPublisher::publish(const std::string& type, const nlohmann::json& payload) const {
    return deliver(type, serialize(type, payload));
}

bool ProgressPublisher::deliver(const std::string& type, const std::string& message) const {
    const auto channel = channel_.lock();
    if (!channel || !channel->isOpen()) {
        log::Registry::scan()->trace("[ProgressPublisher] Dropping {} for closed channel", type);
        return false;
    }

    channel->send(message);
    return true;
}

bool ProgressPublisher::progress(const model::Progress& progress) const {
    return publish("scan_progress", progress);
}
