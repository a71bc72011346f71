#pragma once

#include <utility> // must precede Boost.Asio 1.74 (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace mv::protocols {

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

// host may be a literal address or a resolvable name
tcp::endpoint resolveEndpoint(asio::io_context& ioc, const std::string& host, uint16_t port);

std::string describe(const tcp::endpoint& endpoint);

// Owns a listening socket and hands every accepted connection to onAccept on its own strand.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(asio::io_context& ioc, const tcp::endpoint& endpoint);
    virtual ~Listener() = default;

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    void run();

    // Closes the socket; sessions already handed off finish on their own
    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }
    [[nodiscard]] uint64_t accepted() const noexcept { return accepted_.load(std::memory_order_relaxed); }

protected:
    virtual std::string_view name() const noexcept = 0;
    virtual void onAccept(tcp::socket socket) = 0;

private:
    void accept();
    void handleAccept(const beast::error_code& ec, tcp::socket socket);

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::atomic<uint64_t> accepted_{0};
};

}
