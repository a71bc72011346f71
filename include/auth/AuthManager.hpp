#pragma once

#include "auth/TokenValidator.hpp"
#include "crypto/PasswordHash.hpp"
#include "config/Config.hpp"
#include "util/timestamp.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace mv::types { struct User; }
namespace mv::db { class UserStore; }

namespace mv::auth {

struct AuthResult {
    std::string token;
    std::shared_ptr<types::User> user;
};

void to_json(nlohmann::json& j, const AuthResult& r);

class AuthManager {
  public:
    using IdGenerator = std::function<std::string()>;

    AuthManager(std::shared_ptr<db::UserStore> users,
                const config::AuthConfig& cfg,
                util::Clock clock = util::systemNow,
                IdGenerator newId = nullptr);

    AuthResult registerUser(const std::string& username, const std::string& email, const std::string& password);

    AuthResult login(const std::string& email, const std::string& password);

    // Resolves an Authorization header value ("Bearer <token>") to verified claims
    [[nodiscard]] Claims authenticate(const std::string& authorizationHeader) const;

    // Administrative repair path
    void resetPassword(const std::string& email, const std::string& newPassword);

    // Users whose stored hash is not a recognised Argon2 encoding
    [[nodiscard]] std::vector<std::shared_ptr<types::User>> auditPasswordHashes() const;

    [[nodiscard]] const TokenValidator& tokens() const { return tokens_; }

    static bool isValidName(const std::string& name);
    static bool isValidEmail(const std::string& email);
    static bool isValidPassword(const std::string& password);

  private:
    std::shared_ptr<db::UserStore> users_;
    TokenValidator tokens_;
    crypto::PasswordHashLimits limits_;
    util::Clock clock_;
    IdGenerator newId_;

    AuthResult issueFor(const std::shared_ptr<types::User>& user) const;
    static void isValidRegistration(const std::string& name, const std::string& email, const std::string& password);
};

}
