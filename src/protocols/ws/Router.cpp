#include "protocols/ws/Router.hpp"
#include "protocols/ws/model/Inbound.hpp"
#include "scan/Channel.hpp"
#include "scan/Controller.hpp"
#include "scan/ProgressPublisher.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace ds::protocols::ws;
using namespace ds::protocols::ws::model;

namespace {

struct Dispatcher {
    ds::scan::Controller& controller;
    const std::shared_ptr<ds::scan::Channel>& channel;

    void operator()(const StartScan& req) const {
        controller.startScan(channel, req.drivePath, req.scanDepth);
    }

    void operator()(const StopScan& req) const {
        controller.stopScan(req.taskId);
    }
};

void replyError(const std::shared_ptr<ds::scan::Channel>& channel, const std::string& error) {
    ds::scan::ProgressPublisher(channel).publish("error", {{"error", error}});
}

}

Router::Router(std::shared_ptr<scan::Controller> controller) : controller_(std::move(controller)) {
    if (!controller_) throw std::invalid_argument("Router requires a scan controller");
}

void Router::routeMessage(nlohmann::json&& msg, const std::shared_ptr<scan::Channel>& channel) const {
    if (!channel) throw std::invalid_argument("Router requires a channel to reply on");

    try {
        const auto inbound = parseInbound(msg);
        log::Registry::ws()->debug("[Router] {} from {}", typeOf(inbound), channel->channelId());
        std::visit(Dispatcher{*controller_, channel}, inbound);
    } catch (const ProtocolError& e) {
        log::Registry::ws()->warn("[Router] Rejected message from {}: {}", channel->channelId(), e.what());
        replyError(channel, e.what());
    } catch (const std::exception& e) {
        log::Registry::ws()->error("[Router] Error routing message: {}", e.what());
        replyError(channel, std::string("Internal error: ") + e.what());
    }
}

void Router::onDisconnect(const std::string& channelId) const {
    controller_->onDisconnect(channelId);
}
