#pragma once

#include "protocols/Listener.hpp"

#include <cstdint>
#include <memory>

namespace mv::protocols::http {

class Router;

// Spawns one Session per accepted connection, all sharing the same router
class Server final : public Listener {
public:
    Server(asio::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router,
           uint64_t bodyLimit);

private:
    std::shared_ptr<const Router> router_;
    uint64_t bodyLimit_;

    std::string_view name() const noexcept override { return "HttpServer"; }
    void onAccept(tcp::socket socket) override;
};

}
