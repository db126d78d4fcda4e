#pragma once

#include "protocols/TCPServer.hpp"

#include <memory>

namespace ds::scan { class Controller; }

namespace ds::protocols::ws {

class Router;

class Server final : public TCPServer {
public:
    Server(asio::io_context& ioc, const tcp::endpoint& endpoint,
           std::shared_ptr<scan::Controller> controller, size_t maxMessageBytes);

private:
    std::string_view serverName() const noexcept override { return "WebSocketServer"; }
    void onAccept(tcp::socket socket) override;

    std::shared_ptr<Router> router_;
    size_t maxMessageBytes_;
};

}
