#include "db/DBPool.hpp"
#include "log/Registry.hpp"

namespace mv::db {

DBPool::DBPool(const config::DatabaseConfig& cfg) : cfg_(cfg) {
    const size_t size = cfg_.pool_size == 0 ? 1 : cfg_.pool_size;
    for (size_t i = 0; i < size; ++i) pool_.push(std::make_unique<DBConnection>(cfg_));
    log::Registry::db()->debug("[DBPool] Opened {} connections", size);
}

std::unique_ptr<DBConnection> DBPool::acquire() {
    std::unique_ptr<DBConnection> conn;
    bool prepared;
    {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [&]() { return !pool_.empty(); });
        conn = std::move(pool_.front());
        pool_.pop();
        prepared = prepared_;
    }

    if (conn && conn->isOpen()) return conn;

    log::Registry::db()->warn("[DBPool] Connection lost, reconnecting");
    try {
        auto fresh = std::make_unique<DBConnection>(cfg_);
        if (prepared) fresh->initPrepared();
        return fresh;
    } catch (...) {
        // keep the slot so a later acquire can retry
        release(std::move(conn));
        throw;
    }
}

void DBPool::release(std::unique_ptr<DBConnection> conn) {
    std::lock_guard lock(mtx_);
    pool_.push(std::move(conn));
    cv_.notify_one();
}

void DBPool::initPreparedStatements() {
    std::lock_guard lock(mtx_);
    const auto n = pool_.size();
    for (size_t i = 0; i < n; ++i) {
        auto conn = std::move(pool_.front());
        pool_.pop();
        conn->initPrepared();
        pool_.push(std::move(conn));
    }
    prepared_ = true;
}

}
