#pragma once

#include "db/DBConnection.hpp"
#include "config/Config.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace mv::db {

class DBPool {
  public:
    explicit DBPool(const config::DatabaseConfig& cfg);

    // Replaces a connection that went away while idle
    std::unique_ptr<DBConnection> acquire();
    void release(std::unique_ptr<DBConnection> conn);

    void initPreparedStatements();

  private:
    config::DatabaseConfig cfg_;
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool prepared_ = false;
};

}
