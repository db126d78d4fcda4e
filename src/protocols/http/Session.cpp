#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "log/Registry.hpp"

namespace ds::protocols::http {

Session::Session(tcp::socket socket) : socket_(std::move(socket)) { buffer_.max_size(8192); }

void Session::run() {
    do_read();
}

void Session::do_read() {
    auto self = shared_from_this();

    http::async_read(socket_, buffer_, req_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec) {
        log::Registry::http()->debug("[HttpSession] Read error: {}", ec.message());
        return;
    }

    log::Registry::http()->debug("[HttpSession] Read {} bytes: {} {}", bytes,
                                 std::string(req_.method_string()), std::string(req_.target()));

    auto self = shared_from_this();

    std::shared_ptr<http::response<http::string_body>> res;
    bool close = false;
    try {
        close = !req_.keep_alive();
        res = std::make_shared<http::response<http::string_body>>(Router::route(std::move(req_)));
    } catch (const std::exception& e) {
        log::Registry::http()->error("[HttpSession] Exception during request handling: {}", e.what());

        res = std::make_shared<http::response<http::string_body>>(http::status::internal_server_error, req_.version());
        res->set(http::field::content_type, "text/plain");
        res->body() = "Internal server error";
        res->prepare_payload();
        close = true;
    }

    http::async_write(socket_, *res,
                      [self, res, close](beast::error_code wec, std::size_t written) {
                          self->on_write(close, wec, written);
                      });
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t) {
    if (ec) {
        log::Registry::http()->debug("[HttpSession] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    req_ = {};
    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected)
        log::Registry::http()->debug("[HttpSession] Shutdown error: {}", ec.message());
}

}
