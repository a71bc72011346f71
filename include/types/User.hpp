#pragma once

#include "util/timestamp.hpp"

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace mv::types {

struct User {
    std::string id{}, username{}, email{}, password_hash{};
    util::Timestamp created_at{};

    User() = default;
    User(std::string id, std::string username, std::string email, std::string passwordHash, util::Timestamp createdAt);
    explicit User(const pqxx::row& row);
};

// Public representation; never carries the password hash
void to_json(nlohmann::json& j, const User& u);

std::vector<std::shared_ptr<User>> users_from_pq_res(const pqxx::result& res);

} // namespace mv::types
