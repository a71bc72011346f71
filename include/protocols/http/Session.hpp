#pragma once

#include <utility> // must precede Boost.Asio 1.74 (awaitable.hpp uses std::exchange)
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <optional>

namespace mv::protocols::http {

class Router;

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, std::shared_ptr<const Router> router, uint64_t bodyLimit);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();

    void reject_oversized();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<const Router> router_;
    uint64_t bodyLimit_;
};

}
