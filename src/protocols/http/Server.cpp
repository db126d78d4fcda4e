#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"

using namespace ds::protocols::http;

Server::Server(asio::io_context& ioc, const tcp::endpoint& endpoint)
    : TCPServer(ioc, endpoint, protocols::TcpServerOptions{
          .acceptConcurrency = 1,
          .useStrand = true,
          .channel = protocols::LogChannel::Http
      }) {}

void Server::onAccept(tcp::socket socket) {
    std::make_shared<Session>(std::move(socket))->run();
}
