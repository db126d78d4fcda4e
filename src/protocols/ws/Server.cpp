#include "protocols/ws/Server.hpp"
#include "protocols/ws/Session.hpp"
#include "protocols/ws/Router.hpp"

namespace ds::protocols::ws {

Server::Server(asio::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<scan::Controller> controller, const size_t maxMessageBytes)
    : TCPServer(ioc, endpoint, TcpServerOptions{
          .acceptConcurrency = 4,
          .useStrand = true,
          .channel = LogChannel::WebSocket
      })
    , router_(std::make_shared<Router>(std::move(controller)))
    , maxMessageBytes_(maxMessageBytes) {}

void Server::onAccept(tcp::socket socket) {
    wrap_sys("[WebSocketServer] TCP_NODELAY set failed",
        [&] { socket.set_option(tcp::no_delay(true)); });

    wrap_sys("[WebSocketServer] KEEPALIVE set failed",
        [&] { socket.set_option(asio::socket_base::keep_alive(true)); });

    std::make_shared<Session>(router_, maxMessageBytes_)->accept(std::move(socket));
}

}
