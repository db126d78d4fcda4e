#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json_fwd.hpp>

namespace ds::protocols::ws::model {

// Malformed or unknown inbound message. Reported back as an `error` message.
struct ProtocolError : std::runtime_error {
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

struct StartScan {
    std::string drivePath;               // empty when omitted, rejected downstream as an invalid root
    std::optional<int64_t> scanDepth;
};

struct StopScan {
    std::string taskId;
};

using Inbound = std::variant<StartScan, StopScan>;

Inbound parseInbound(const nlohmann::json& msg);

std::string typeOf(const Inbound& msg);

}
