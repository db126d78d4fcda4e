#pragma once

#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ds::scan {

class Channel;

namespace model { struct Progress; }

// Wraps payloads in the {type, payload} envelope and drops them when the channel is gone.
class ProgressPublisher {
public:
    explicit ProgressPublisher(std::weak_ptr<Channel> channel);

    bool publish(const std::string& type, const nlohmann::json& payload) const;
    bool progress(const model::Progress& progress) const;

    // Sends an envelope that was already serialized.
    bool deliver(const std::string& type, const std::string& message) const;

    [[nodiscard]] bool isConnected() const;

    static nlohmann::json envelope(const std::string& type, const nlohmann::json& payload);

    // Envelope as text. Bytes that are not valid UTF-8 become U+FFFD.
    static std::string serialize(const std::string& type, const nlohmann::json& payload);

private:
    std::weak_ptr<Channel> channel_;
};

}
