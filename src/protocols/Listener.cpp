#include "protocols/Listener.hpp"
#include "log/Registry.hpp"

#include <boost/system/system_error.hpp>
#include <stdexcept>
#include <utility>

namespace mv::protocols {

namespace {

template <class Fn>
void bindStep(const std::string_view step, const tcp::endpoint& endpoint, Fn&& fn) {
    try { std::forward<Fn>(fn)(); }
    catch (const boost::system::system_error& e) {
        throw std::runtime_error("Listener failed to " + std::string(step) + " on " + describe(endpoint) + ": " + e.what());
    }
}

}

tcp::endpoint resolveEndpoint(asio::io_context& ioc, const std::string& host, const uint16_t port) {
    boost::system::error_code ec;
    const auto address = asio::ip::make_address(host, ec);
    if (!ec) return {address, port};

    tcp::resolver resolver(ioc);
    const auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec || results.empty())
        throw std::runtime_error("Failed to resolve listen address " + host + ": " +
                                 (ec ? ec.message() : std::string("no results")));
    return results.begin()->endpoint();
}

std::string describe(const tcp::endpoint& endpoint) {
    const auto addr = endpoint.address();
    if (addr.is_v6()) return "[" + addr.to_string() + "]:" + std::to_string(endpoint.port());
    return addr.to_string() + ":" + std::to_string(endpoint.port());
}

Listener::Listener(asio::io_context& ioc, const tcp::endpoint& endpoint) : ioc_(ioc), acceptor_(ioc) {
    bindStep("open", endpoint, [&] { acceptor_.open(endpoint.protocol()); });
    bindStep("set reuse_address", endpoint, [&] { acceptor_.set_option(asio::socket_base::reuse_address(true)); });
    bindStep("bind", endpoint, [&] { acceptor_.bind(endpoint); });
    bindStep("listen", endpoint, [&] { acceptor_.listen(asio::socket_base::max_listen_connections); });
}

void Listener::run() {
    log::Registry::http()->info("[{}] Listening on {}", name(), describe(acceptor_.local_endpoint()));
    accept();
}

void Listener::stop() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        if (!self->acceptor_.is_open()) return;
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) log::Registry::http()->warn("[{}] Failed to close listener: {}", self->name(), ec.message());
        log::Registry::http()->info("[{}] Stopped after {} connections", self->name(), self->accepted());
    });
}

void Listener::accept() {
    acceptor_.async_accept(asio::make_strand(ioc_),
        [self = shared_from_this()](const beast::error_code& ec, tcp::socket socket) {
            self->handleAccept(ec, std::move(socket));
        });
}

void Listener::handleAccept(const beast::error_code& ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted || !acceptor_.is_open()) return;

    accept();

    if (ec) {
        log::Registry::http()->debug("[{}] accept error: {}", name(), ec.message());
        return;
    }

    accepted_.fetch_add(1, std::memory_order_relaxed);
    onAccept(std::move(socket));
}

}
