#pragma once

#include "protocols/TCPServer.hpp"

namespace ds::protocols::http {

class Server final : public TCPServer {
public:
    Server(asio::io_context& ioc, const tcp::endpoint& endpoint);

private:
    std::string_view serverName() const noexcept override { return "HttpServer"; }
    void onAccept(tcp::socket socket) override;
};

}
