#pragma once

#include <utility>

#include "protocols/TCPAcceptor.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <memory>
#include <string_view>

namespace spdlog { class logger; }

namespace ds::protocols {

enum class LogChannel { Http, WebSocket, General };

struct TcpServerOptions {
    unsigned int acceptConcurrency{1};
    bool useStrand{true};
    LogChannel channel{LogChannel::General};
};

class TCPServer : public std::enable_shared_from_this<TCPServer> {
public:
    TCPServer(asio::io_context& ioc, const tcp::endpoint& endpoint, TcpServerOptions opts);
    virtual ~TCPServer() = default;

    void run();

    // Closes the acceptor; pending accepts complete with operation_aborted.
    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

protected:
    virtual std::string_view serverName() const noexcept = 0;
    virtual void onAccept(tcp::socket socket) = 0;

    virtual void onAcceptError(const beast::error_code& ec);

    asio::io_context& ioc() const noexcept { return ioc_; }

    std::shared_ptr<spdlog::logger> logger() const;

private:
    void logStart() const;
    void doAccept();

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    TcpServerOptions opts_;
};

}
