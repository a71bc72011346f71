#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "log/Registry.hpp"

#include <chrono>

namespace mv::protocols::http {

static constexpr auto READ_TIMEOUT = std::chrono::seconds(120);

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router, const uint64_t bodyLimit)
    : stream_(std::move(socket)), router_(std::move(router)), bodyLimit_(bodyLimit) {}

void Session::run() {
    // start on the connection's strand
    boost::asio::dispatch(stream_.get_executor(), [self = shared_from_this()] { self->do_read(); });
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(bodyLimit_);
    stream_.expires_after(READ_TIMEOUT);

    auto self = shared_from_this();
    http::async_read(stream_, buffer_, *parser_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec == http::error::body_limit) {
        log::Registry::http()->warn("[Session] Request body exceeds {} bytes", bodyLimit_);
        return reject_oversized();
    }

    if (ec) {
        if (ec != beast::error::timeout) log::Registry::http()->debug("[Session] Read error: {}", ec.message());
        return do_close();
    }

    log::Registry::http()->trace("[Session] Read {} bytes", bytes);

    const auto req = parser_->release();
    auto res = std::make_shared<string_response>(router_->route(req));
    const bool close = res->need_eof();

    auto self = shared_from_this();
    http::async_write(stream_, *res,
                      [self, res, close](beast::error_code ec, std::size_t bytes) {
                          self->on_write(close, ec, bytes);
                      });
}

void Session::reject_oversized() {
    auto res = std::make_shared<string_response>(http::status::payload_too_large, 11);
    res->set(http::field::content_type, "application/json");
    res->keep_alive(false);
    res->body() = R"({"error":{"code":"PAYLOAD_TOO_LARGE","message":"Request body too large"}})";
    res->prepare_payload();

    auto self = shared_from_this();
    http::async_write(stream_, *res,
                      [self, res](beast::error_code ec, std::size_t bytes) {
                          self->on_write(true, ec, bytes);
                      });
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes;

    if (ec) {
        log::Registry::http()->debug("[Session] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}

}
