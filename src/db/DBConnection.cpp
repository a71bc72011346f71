#include "db/DBConnection.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

namespace mv::db {

DBConnection::DBConnection(config::DatabaseConfig cfg)
    : cfg_(std::move(cfg)), conn_(std::make_unique<pqxx::connection>(cfg_.connectionString())) {
    log::Registry::db()->trace("[DBConnection] Connected to {}:{}/{}", cfg_.host, cfg_.port, cfg_.name);
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

bool DBConnection::isOpen() const { return conn_ && conn_->is_open(); }

void DBConnection::initPrepared() const {
    if (!isOpen()) throw std::runtime_error("Database connection is not open");

    initPreparedUsers();
    initPreparedMedia();
}

}
