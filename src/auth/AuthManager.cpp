#include "auth/AuthManager.hpp"
#include "crypto/PasswordHash.hpp"
#include "crypto/uuid.hpp"
#include "db/UserStore.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "types/User.hpp"

#include <cctype>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string_view>

namespace mv::auth {

static constexpr const auto* BAD_CREDENTIALS = "Invalid email or password";

void to_json(nlohmann::json& j, const AuthResult& r) {
    j = {{"token", r.token}, {"user", *r.user}};
}

AuthManager::AuthManager(std::shared_ptr<db::UserStore> users,
                         const config::AuthConfig& cfg,
                         util::Clock clock,
                         IdGenerator newId)
    : users_(std::move(users)),
      tokens_(cfg, clock),
      limits_{cfg.pwhash_ops_limit, cfg.pwhash_mem_limit},
      clock_(std::move(clock)),
      newId_(newId ? std::move(newId) : IdGenerator([] { return ids::uuid4_hex(); })) {
    if (!users_) throw std::invalid_argument("AuthManager requires a user store");
}

AuthResult AuthManager::registerUser(const std::string& username, const std::string& email,
                                     const std::string& password) {
    isValidRegistration(username, email, password);

    log::Registry::auth()->debug("[AuthManager] Registration attempt for {}", email);
    if (users_->getByEmail(email)) {
        log::Registry::auth()->warn("[AuthManager] Registration failed, email already exists: {}", email);
        throw error::Conflict("User with this email already exists");
    }

    const types::User user(newId_(), username, email, crypto::hashPassword(password, limits_), clock_());

    // a concurrent registration can still win between the lookup and the insert
    const auto created = users_->create(user);
    if (!created.created()) {
        log::Registry::auth()->warn("[AuthManager] Registration lost a race for {}", email);
        throw error::Conflict("User with this email already exists");
    }

    log::Registry::auth()->info("[AuthManager] Registered new user: {}", email);
    return issueFor(created.record);
}

AuthResult AuthManager::login(const std::string& email, const std::string& password) {
    const auto user = users_->getByEmail(email);
    if (!user) {
        log::Registry::auth()->warn("[AuthManager] Login failed, unknown email: {}", email);
        throw error::AuthError(error::AuthError::Reason::BadCredentials, BAD_CREDENTIALS);
    }

    if (!crypto::verifyPassword(password, user->password_hash)) {
        log::Registry::auth()->warn("[AuthManager] Login failed, wrong password for: {}", email);
        throw error::AuthError(error::AuthError::Reason::BadCredentials, BAD_CREDENTIALS);
    }

    log::Registry::auth()->debug("[AuthManager] User logged in: {}", email);
    return issueFor(user);
}

Claims AuthManager::authenticate(const std::string& authorizationHeader) const {
    static constexpr std::string_view scheme = "Bearer ";

    if (authorizationHeader.size() <= scheme.size())
        throw error::AuthError(error::AuthError::Reason::MissingToken, "Not authenticated");

    for (size_t i = 0; i < scheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(authorizationHeader[i])) !=
            std::tolower(static_cast<unsigned char>(scheme[i])))
            throw error::AuthError(error::AuthError::Reason::MissingToken, "Not authenticated");
    }

    const auto start = authorizationHeader.find_first_not_of(' ', scheme.size());
    if (start == std::string::npos) throw error::AuthError(error::AuthError::Reason::MissingToken, "Not authenticated");

    return tokens_.verify(authorizationHeader.substr(start));
}

void AuthManager::resetPassword(const std::string& email, const std::string& newPassword) {
    if (!isValidPassword(newPassword))
        throw error::ValidationError("Password must be at least 6 characters");

    const auto user = users_->getByEmail(email);
    if (!user) throw error::NotFound("User not found: " + email);

    if (!users_->updatePasswordHash(user->id, crypto::hashPassword(newPassword, limits_)))
        throw error::NotFound("User not found: " + email);

    log::Registry::auth()->info("[AuthManager] Password reset for {}", email);
}

std::vector<std::shared_ptr<types::User>> AuthManager::auditPasswordHashes() const {
    std::vector<std::shared_ptr<types::User>> flagged;
    for (auto& user : users_->list())
        if (!crypto::isPasswordHash(user->password_hash)) flagged.push_back(user);
    return flagged;
}

AuthResult AuthManager::issueFor(const std::shared_ptr<types::User>& user) const {
    return {tokens_.issue({user->id, user->email}), user};
}

void AuthManager::isValidRegistration(const std::string& name, const std::string& email, const std::string& password) {
    std::vector<std::string> errors;

    if (!isValidName(name)) errors.emplace_back("Username must be between 3 and 50 characters.");
    if (!isValidEmail(email)) errors.emplace_back("Email must be a valid address.");
    if (!isValidPassword(password)) errors.emplace_back("Password must be at least 6 characters.");

    if (errors.empty()) return;

    std::string details;
    for (const auto& err : errors) details += (details.empty() ? "" : " ") + err;
    throw error::ValidationError("Registration failed", details);
}

bool AuthManager::isValidName(const std::string& name) {
    return name.size() >= 3 && name.size() <= 50;
}

bool AuthManager::isValidEmail(const std::string& email) {
    const auto at = email.find('@');
    if (at == std::string::npos || at == 0 || email.find('@', at + 1) != std::string::npos) return false;
    if (email.find_first_of(" \t\r\n") != std::string::npos) return false;

    const auto domain = email.substr(at + 1);
    const auto dot = domain.find('.');
    return dot != std::string::npos && dot > 0 && dot + 1 < domain.size() && domain.back() != '.';
}

bool AuthManager::isValidPassword(const std::string& password) {
    return password.size() >= 6;
}

}
