#pragma once

#include "db/StoreResult.hpp"
#include "types/User.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mv::db {

// Users collection. Lookups return nullptr when absent; backend failures throw error::BackendUnavailable.
class UserStore {
public:
    using UserPtr = std::shared_ptr<types::User>;

    virtual ~UserStore() = default;

    // AlreadyExists when the id or email is taken
    virtual CreateResult<types::User> create(const types::User& user) = 0;

    virtual UserPtr getById(const std::string& id) = 0;
    virtual UserPtr getByEmail(const std::string& email) = 0;

    // Administrative repair path; false when the user does not exist
    virtual bool updatePasswordHash(const std::string& id, const std::string& passwordHash) = 0;

    virtual std::vector<UserPtr> list() = 0;
};

}
