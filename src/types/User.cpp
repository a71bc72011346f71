#include "types/User.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/row>
#include <pqxx/result>

namespace mv::types {

User::User(std::string id, std::string username, std::string email, std::string passwordHash,
           const util::Timestamp createdAt)
    : id(std::move(id)), username(std::move(username)), email(std::move(email)),
      password_hash(std::move(passwordHash)), created_at(createdAt) {}

User::User(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      username(row["username"].as<std::string>()),
      email(row["email"].as<std::string>()),
      password_hash(row["password_hash"].as<std::string>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())) {}

void to_json(nlohmann::json& j, const User& u) {
    j = {
        {"id", u.id},
        {"username", u.username},
        {"email", u.email},
        {"createdAt", util::timestampToString(u.created_at)}
    };
}

std::vector<std::shared_ptr<User>> users_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<User>> users;
    users.reserve(res.size());
    for (const auto& row : res) users.push_back(std::make_shared<User>(row));
    return users;
}

}
