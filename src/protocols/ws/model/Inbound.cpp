#include "protocols/ws/model/Inbound.hpp"

#include <nlohmann/json.hpp>

using namespace ds::protocols::ws::model;
using json = nlohmann::json;

namespace {

const json& payloadOf(const json& msg) {
    static const json empty = json::object();
    const auto it = msg.find("payload");
    if (it == msg.end() || it->is_null()) return empty;
    if (!it->is_object()) throw ProtocolError("Message payload must be an object");
    return *it;
}

StartScan parseStartScan(const json& payload) {
    StartScan req;

    if (const auto it = payload.find("drivePath"); it != payload.end() && !it->is_null()) {
        if (!it->is_string()) throw ProtocolError("start_scan.drivePath must be a string");
        req.drivePath = it->get<std::string>();
    }

    if (const auto it = payload.find("scanDepth"); it != payload.end() && !it->is_null()) {
        if (!it->is_number_integer()) throw ProtocolError("start_scan.scanDepth must be an integer");
        req.scanDepth = it->get<int64_t>();
    }

    return req;
}

StopScan parseStopScan(const json& payload) {
    const auto it = payload.find("taskId");
    if (it == payload.end() || !it->is_string()) throw ProtocolError("stop_scan.taskId must be a string");
    return StopScan{it->get<std::string>()};
}

}

Inbound ds::protocols::ws::model::parseInbound(const json& msg) {
    if (!msg.is_object()) throw ProtocolError("Message must be a JSON object");

    const auto typeIt = msg.find("type");
    if (typeIt == msg.end() || !typeIt->is_string()) throw ProtocolError("Message is missing a string 'type'");

    const auto type = typeIt->get<std::string>();
    const auto& payload = payloadOf(msg);

    if (type == "start_scan") return parseStartScan(payload);
    if (type == "stop_scan") return parseStopScan(payload);

    throw ProtocolError("Unknown message type: " + type);
}

std::string ds::protocols::ws::model::typeOf(const Inbound& msg) {
    return std::holds_alternative<StartScan>(msg) ? "start_scan" : "stop_scan";
}
