#pragma once

#include <utility>

#include "scan/Channel.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace ds::protocols::ws {

class Router;

namespace beast     = boost::beast;
namespace websocket = beast::websocket;
namespace asio      = boost::asio;
using tcp           = asio::ip::tcp;
using json          = nlohmann::json;

using RequestType = beast::http::request<beast::http::string_body>;

class Session final : public scan::Channel, public std::enable_shared_from_this<Session> {
public:
    Session(const std::shared_ptr<Router>& router, size_t maxMessageBytes);
    ~Session() override;

    void accept(tcp::socket&& socket);
    void close();

    // scan::Channel
    const std::string& channelId() const override { return uuid_; }
    bool isOpen() const override { return open_.load() && !closing_.load(); }
    void send(const std::string& message) override;

    void sendError(std::string_view error);

    static std::string generateUUIDv4();

private:
    void doRead();
    void onRead(const beast::error_code& ec, std::size_t bytesRead);

    void maybeStartWrite();
    void doWrite();
    void onWrite(const beast::error_code& ec, std::size_t bytesWritten);

    void onHeadersRead(const std::shared_ptr<RequestType>& req, const beast::error_code& ec, std::size_t bytesRead);
    void onHandshakeAccepted(const beast::error_code& ec);
    void hydrateFromRequest(const RequestType& req);
    void installHandshakeDecorator() const;

    static void logFail(std::string_view where, const beast::error_code& ec);

    const std::string uuid_{generateUUIDv4()};

    std::shared_ptr<websocket::stream<tcp::socket>> ws_;
    asio::any_io_executor strand_;

    beast::flat_buffer buffer_{8192};
    beast::flat_buffer tmpBuffer_{4096}; // used during HTTP header read/handshake

    std::shared_ptr<Router> router_;

    std::string userAgent_ = "unknown";
    std::string ipAddress_ = "unknown";

    std::atomic_bool open_{false};
    std::atomic_bool closing_{false};

    bool writing_ = false;                 // only touched on strand
    std::deque<std::string> writeQueue_;   // only touched on strand
};

}
