#include "db/query/UserQueries.hpp"
#include "db/Transactions.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <pqxx/pqxx>

using namespace mv::db;
using namespace mv::db::query;
using namespace mv::types;

UserQueries::UserQueries(std::shared_ptr<Transactions> txns) : txns_(std::move(txns)) {}

CreateResult<User> UserQueries::create(const User& user) {
    return txns_->exec("UserQueries::create", [&](pqxx::work& txn) -> CreateResult<User> {
        const auto res = txn.exec(pqxx::prepped{"insert_user"},
                                  pqxx::params{user.id, user.username, user.email, user.password_hash,
                                               util::timestampToString(user.created_at)});
        if (res.empty()) {
            log::Registry::db()->debug("[UserQueries] User {} or email {} already exists", user.id, user.email);
            return CreateResult<User>::AlreadyExists();
        }
        return CreateResult<User>::Created(std::make_shared<User>(res.one_row()));
    });
}

UserStore::UserPtr UserQueries::getById(const std::string& id) {
    return txns_->exec("UserQueries::getById", [&](pqxx::work& txn) -> UserPtr {
        const auto res = txn.exec(pqxx::prepped{"get_user"}, pqxx::params{id});
        if (res.empty()) {
            log::Registry::db()->trace("[UserQueries] No user found with id: {}", id);
            return nullptr;
        }
        return std::make_shared<User>(res.one_row());
    });
}

UserStore::UserPtr UserQueries::getByEmail(const std::string& email) {
    return txns_->exec("UserQueries::getByEmail", [&](pqxx::work& txn) -> UserPtr {
        const auto res = txn.exec(pqxx::prepped{"get_user_by_email"}, pqxx::params{email});
        if (res.empty()) return nullptr;
        return std::make_shared<User>(res.one_row());
    });
}

bool UserQueries::updatePasswordHash(const std::string& id, const std::string& passwordHash) {
    return txns_->exec("UserQueries::updatePasswordHash", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"update_user_password"}, pqxx::params{id, passwordHash});
        return res.affected_rows() > 0;
    });
}

std::vector<UserStore::UserPtr> UserQueries::list() {
    return txns_->exec("UserQueries::list", [&](pqxx::work& txn) {
        return users_from_pq_res(txn.exec(pqxx::prepped{"list_users"}));
    });
}
