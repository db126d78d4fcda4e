#pragma once

#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ds::scan {
class Channel;
class Controller;
}

namespace ds::protocols::ws {

// Maps inbound client messages onto the scan controller. Malformed or
// unknown messages are answered with an `error` envelope on the same channel.
class Router {
public:
    explicit Router(std::shared_ptr<scan::Controller> controller);

    void routeMessage(nlohmann::json&& msg, const std::shared_ptr<scan::Channel>& channel) const;

    void onDisconnect(const std::string& channelId) const;

private:
    std::shared_ptr<scan::Controller> controller_;
};

}
