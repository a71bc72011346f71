// Services
#include "protocols/Listener.hpp"
#include "protocols/http/Server.hpp"
#include "protocols/http/Router.hpp"
#include "auth/AuthManager.hpp"
#include "media/MediaManager.hpp"

// Database
#include "db/DBPool.hpp"
#include "db/Transactions.hpp"
#include "db/Schema.hpp"
#include "db/query/UserQueries.hpp"
#include "db/query/MediaQueries.hpp"

// Storage
#include "storage/S3ObjectStore.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <boost/asio/signal_set.hpp>
#include <algorithm>
#include <iostream>
#include <thread>
#include <vector>

using namespace mv::config;

namespace {
constexpr uint64_t MULTIPART_OVERHEAD_BYTES = 1024 * 1024;
}

int main() {
    try {
        ConfigRegistry::init(ConfigRegistry::configPathFromEnv());
        mv::log::Registry::init();

        const auto& cfg = ConfigRegistry::get();
        if (cfg.auth.jwt_secret.empty()) throw std::runtime_error("auth.jwt_secret (MEDIAVAULT_JWT_SECRET) must be set");

        mv::log::Registry::mediavault()->info("[*] Initializing MediaVault services...");

        auto pool = std::make_shared<mv::db::DBPool>(cfg.database);
        auto txns = std::make_shared<mv::db::Transactions>(pool);
        mv::db::initTables(*txns, cfg.database);
        pool->initPreparedStatements();
        mv::log::Registry::mediavault()->info("[✓] Metadata store ready ({}@{}:{}/{})", cfg.database.user,
                                              cfg.database.host, cfg.database.port, cfg.database.name);

        auto users = std::make_shared<mv::db::query::UserQueries>(txns);
        auto media = std::make_shared<mv::db::query::MediaQueries>(txns);
        auto objects = std::make_shared<mv::storage::S3ObjectStore>(cfg.object_store);

        auto auth = std::make_shared<mv::auth::AuthManager>(users, cfg.auth);
        auto mediaManager = std::make_shared<mv::media::MediaManager>(media, objects, cfg.media);
        auto router = std::make_shared<const mv::protocols::http::Router>(auth, mediaManager, cfg.server,
                                                                           cfg.dev.enabled);

        const auto threads = std::max(1u, cfg.server.threads);
        boost::asio::io_context ioc{static_cast<int>(threads)};

        const auto endpoint = mv::protocols::resolveEndpoint(ioc, cfg.server.host, cfg.server.port);
        auto server = std::make_shared<mv::protocols::http::Server>(
            ioc, endpoint, router, cfg.media.max_upload_size_bytes + MULTIPART_OVERHEAD_BYTES);
        server->run();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, const int signum) {
            if (ec) return;
            mv::log::Registry::mediavault()->info("[!] Signal {} received. Shutting down gracefully...", signum);
            server->stop();
            ioc.stop();
        });

        mv::log::Registry::mediavault()->info("[✓] MediaVault listening on {} with {} threads",
                                              mv::protocols::describe(endpoint), threads);

        std::vector<std::thread> workers;
        workers.reserve(threads - 1);
        for (unsigned int i = 1; i < threads; ++i) workers.emplace_back([&ioc] { ioc.run(); });
        ioc.run();
        for (auto& t : workers) t.join();

        mv::log::Registry::mediavault()->info("[✓] MediaVault shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (mv::log::Registry::isInitialized())
            mv::log::Registry::mediavault()->error("[-] Failed to run MediaVault: {}", e.what());
        else
            std::cerr << "Failed to run MediaVault: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
