#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace mv::db {

class DBConnection {
  public:
    explicit DBConnection(config::DatabaseConfig cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;
    [[nodiscard]] bool isOpen() const;

    // Statements reference the tables, so this runs after the schema exists
    void initPrepared() const;

  private:
    config::DatabaseConfig cfg_;
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedUsers() const;
    void initPreparedMedia() const;
};

}
