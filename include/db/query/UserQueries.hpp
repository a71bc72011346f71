#pragma once

#include "db/UserStore.hpp"

#include <memory>

namespace mv::db {
class Transactions;
}

namespace mv::db::query {

// PostgreSQL-backed UserStore
class UserQueries final : public UserStore {
public:
    explicit UserQueries(std::shared_ptr<Transactions> txns);

    CreateResult<types::User> create(const types::User& user) override;
    UserPtr getById(const std::string& id) override;
    UserPtr getByEmail(const std::string& email) override;
    bool updatePasswordHash(const std::string& id, const std::string& passwordHash) override;
    std::vector<UserPtr> list() override;

private:
    std::shared_ptr<Transactions> txns_;
};

}
