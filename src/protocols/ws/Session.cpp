#include "protocols/ws/Session.hpp"
#include "protocols/ws/Router.hpp"
#include "scan/ProgressPublisher.hpp"
#include "log/Registry.hpp"

#include <boost/beast/http.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/asio.hpp>

namespace {
namespace beast     = boost::beast;
namespace websocket = beast::websocket;
namespace asio      = boost::asio;
} // namespace

namespace ds::protocols::ws {

Session::Session(const std::shared_ptr<Router>& router, const size_t maxMessageBytes) : router_(router) {
    buffer_.max_size(maxMessageBytes);
}

Session::~Session() {
    log::Registry::ws()->debug("[Session] Session {} destroyed for IP: {}", uuid_, ipAddress_);
}

void Session::logFail(std::string_view where, const beast::error_code& ec) {
    if (!ec) return;
    log::Registry::ws()->debug("[Session] {}: {}", where, ec.message());
}

void Session::accept(tcp::socket&& socket) {
    ws_ = std::make_shared<websocket::stream<tcp::socket>>(std::move(socket));
    strand_ = asio::make_strand(ws_->get_executor());

    auto req = std::make_shared<RequestType>();
    auto self = shared_from_this();

    beast::http::async_read(
        ws_->next_layer(),
        tmpBuffer_,
        *req,
        asio::bind_executor(
            strand_,
            [self, req](const beast::error_code& ec, std::size_t bytesRead) {
                self->onHeadersRead(req, ec, bytesRead);
            }));
}

void Session::onHeadersRead(const std::shared_ptr<RequestType>& req, const beast::error_code& ec, std::size_t) {
    if (ec) return logFail("Error reading HTTP headers", ec);

    hydrateFromRequest(*req);

    if (!websocket::is_upgrade(*req)) {
        log::Registry::ws()->debug("[Session] Non-upgrade request from {} dropped", ipAddress_);
        beast::error_code ignored;
        ws_->next_layer().shutdown(tcp::socket::shutdown_both, ignored);
        return;
    }

    installHandshakeDecorator();

    auto self = shared_from_this();
    ws_->async_accept(
        *req,
        asio::bind_executor(
            strand_,
            [self](const beast::error_code& ec2) {
                self->onHandshakeAccepted(ec2);
            }));
}

void Session::hydrateFromRequest(const RequestType& req) {
    beast::error_code ec;
    const auto remote = ws_->next_layer().remote_endpoint(ec);
    if (!ec) ipAddress_ = remote.address().to_string();

    if (const auto it = req.find(beast::http::field::user_agent); it != req.end())
        userAgent_ = std::string(it->value());
}

void Session::installHandshakeDecorator() const {
    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_->set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(beast::http::field::server, "diskscout");
        }
    ));
}

void Session::onHandshakeAccepted(const beast::error_code& ec) {
    if (ec) return logFail("Handshake error", ec);

    open_ = true;
    log::Registry::ws()->info("[Session] {} connected from {} ({})", uuid_, ipAddress_, userAgent_);
    doRead();
}

void Session::close() {
    if (closing_.exchange(true)) return;
    open_ = false;

    if (router_) router_->onDisconnect(uuid_);

    auto ws = ws_;
    if (!ws) {
        buffer_.consume(buffer_.size());
        return;
    }

    auto self = shared_from_this();
    asio::post(strand_, [self, ws]() mutable {
        boost::system::error_code ec;
        if (ws->is_open())
            ws->close(websocket::close_code::normal, ec);

        if (ec)
            log::Registry::ws()->debug("[Session] ws close error: {}", ec.message());

        self->ws_.reset();
        self->writeQueue_.clear();
        self->buffer_.consume(self->buffer_.size());

        log::Registry::ws()->info("[Session] {} closed for IP: {}", self->uuid_, self->ipAddress_);
    });
}

void Session::send(const std::string& message) {
    if (!isOpen()) return;

    auto self = shared_from_this();

    asio::post(strand_, [self, payload = message]() mutable {
        self->writeQueue_.push_back(std::move(payload));
        self->maybeStartWrite();
    });
}

void Session::sendError(const std::string_view error) {
    send(scan::ProgressPublisher::serialize("error", {{"error", std::string(error)}}));
}

void Session::maybeStartWrite() {
    if (writing_ || writeQueue_.empty()) return;
    writing_ = true;
    doWrite();
}

void Session::doWrite() {
    if (!ws_) {
        writing_ = false;
        writeQueue_.clear();
        return;
    }

    ws_->text(true);
    ws_->async_write(
        asio::buffer(writeQueue_.front()),
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](const beast::error_code& ec, std::size_t bytesWritten) {
                self->onWrite(ec, bytesWritten);
            }));
}

void Session::onWrite(const beast::error_code& ec, std::size_t) {
    if (ec) {
        logFail("Write error", ec);
        writing_ = false;
        writeQueue_.clear();
        return close();
    }

    writeQueue_.pop_front();
    if (writeQueue_.empty()) {
        writing_ = false;
        return;
    }

    doWrite();
}

void Session::doRead() {
    if (!ws_) return;

    ws_->async_read(
        buffer_,
        asio::bind_executor(
            strand_,
            [self = shared_from_this()](const beast::error_code& ec, const std::size_t bytesRead) {
                self->onRead(ec, bytesRead);
            }));
}

void Session::onRead(const beast::error_code& ec, std::size_t) {
    if (ec == websocket::error::closed) {
        log::Registry::ws()->debug("[Session] WebSocket closed gracefully by peer");
        return close();
    }
    if (ec == asio::error::eof) {
        log::Registry::ws()->debug("[Session] WebSocket peer vanished (EOF)");
        return close();
    }
    if (ec) {
        logFail("Read error", ec);
        return close();
    }

    if (ws_->got_binary()) {
        sendError("Binary frames are not supported");
    } else {
        const auto text = beast::buffers_to_string(buffer_.data());
        auto msg = json::parse(text, nullptr, false);
        if (msg.is_discarded()) {
            log::Registry::ws()->debug("[Session] Unparsable message from {}", uuid_);
            sendError("Failed to parse message as JSON");
        } else {
            router_->routeMessage(std::move(msg), shared_from_this());
        }
    }

    buffer_.consume(buffer_.size());
    doRead();
}

std::string Session::generateUUIDv4() {
    static thread_local boost::uuids::random_generator generator;
    const boost::uuids::uuid uuid = generator();
    return boost::uuids::to_string(uuid);
}

}
