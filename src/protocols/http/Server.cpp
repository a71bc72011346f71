#include "protocols/http/Server.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Session.hpp"

#include <stdexcept>

using namespace mv::protocols::http;

Server::Server(asio::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router,
               const uint64_t bodyLimit)
    : Listener(ioc, endpoint), router_(std::move(router)), bodyLimit_(bodyLimit) {
    if (!router_) throw std::invalid_argument("HttpServer requires a router");
}

void Server::onAccept(tcp::socket socket) {
    std::make_shared<Session>(std::move(socket), router_, bodyLimit_)->run();
}
