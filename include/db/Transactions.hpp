#pragma once

#include "db/DBPool.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace mv::db {

class Transactions {
  public:
    explicit Transactions(std::shared_ptr<DBPool> pool) : dbPool_(std::move(pool)) {
        if (!dbPool_) throw std::invalid_argument("Transactions requires a connection pool");
    }

    // Runs func inside one pqxx::work. libpqxx failures surface as error::BackendUnavailable.
    template <typename Func>
    auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);

        std::unique_ptr<DBConnection> conn;
        try {
            conn = dbPool_->acquire();
        } catch (const pqxx::failure& e) {
            log::Registry::db()->error("[Transactions::exec] No connection for '{}': {}", ctx, e.what());
            throw error::BackendUnavailable("metadata store", e.what());
        }

        try {
            pqxx::work txn(conn->get());
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const pqxx::failure& e) {
            log::Registry::db()->error("[Transactions::exec] Database failure in '{}', rolling back: {}", ctx, e.what());
            dbPool_->release(std::move(conn));
            throw error::BackendUnavailable("metadata store", e.what());
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}", ctx, e.what());
            dbPool_->release(std::move(conn));
            throw;
        }

        if constexpr (!std::is_void_v<decltype(func(std::declval<pqxx::work&>()))>) {
            throw std::logic_error("Unreachable path in Transactions::exec");
        }
    }

  private:
    std::shared_ptr<DBPool> dbPool_;
};

}
