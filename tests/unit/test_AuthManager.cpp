#include <gtest/gtest.h>
#include "auth/AuthManager.hpp"
#include "crypto/PasswordHash.hpp"
#include "error/Error.hpp"
#include "types/User.hpp"
#include "FixedClock.hpp"
#include "MemoryUserStore.hpp"

#include <nlohmann/json.hpp>
#include <sodium.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace mv;
using Reason = error::AuthError::Reason;

class AuthManagerTest : public ::testing::Test {
protected:
    test::FixedClock clock;
    std::shared_ptr<test::MemoryUserStore> users = std::make_shared<test::MemoryUserStore>();
    std::unique_ptr<auth::AuthManager> authManager_;

    void SetUp() override {
        config::AuthConfig cfg;
        cfg.jwt_secret = "unit-test-secret";
        cfg.pwhash_ops_limit = crypto_pwhash_OPSLIMIT_MIN;
        cfg.pwhash_mem_limit = crypto_pwhash_MEMLIMIT_MIN;
        authManager_ = std::make_unique<auth::AuthManager>(users, cfg, clock.fn());
    }

    static Reason reasonOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const error::AuthError& e) {
            return e.reason();
        }
        ADD_FAILURE() << "expected an AuthError";
        return Reason::TokenInvalid;
    }
};

TEST_F(AuthManagerTest, RegisterUser_Success) {
    const auto result = authManager_->registerUser("Cooper Test", "a@x.com", "secret1");

    ASSERT_NE(result.user, nullptr);
    EXPECT_FALSE(result.token.empty());
    EXPECT_EQ(result.user->username, "Cooper Test");
    EXPECT_EQ(result.user->email, "a@x.com");
    EXPECT_EQ(result.user->created_at, clock.now());
    EXPECT_NE(result.user->password_hash, "secret1");

    const auto stored = users->getByEmail("a@x.com");
    ASSERT_NE(stored, nullptr);
    EXPECT_TRUE(crypto::verifyPassword("secret1", stored->password_hash));

    EXPECT_EQ(authManager_->tokens().verify(result.token).subject_id, result.user->id);
}

TEST_F(AuthManagerTest, RegisterUser_DuplicateEmail_IsConflict) {
    authManager_->registerUser("First User", "a@x.com", "secret1");
    EXPECT_THROW(authManager_->registerUser("Second User", "a@x.com", "other12"), error::Conflict);
    EXPECT_EQ(users->size(), 1u);
}

TEST_F(AuthManagerTest, RegisterUser_ConcurrentSameEmail_ExactlyOneWins) {
    std::atomic<int> created{0}, conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            try {
                authManager_->registerUser("racer" + std::to_string(i), "race@x.com", "secret1");
                ++created;
            } catch (const error::Conflict&) {
                ++conflicts;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(conflicts.load(), 7);
    EXPECT_EQ(users->size(), 1u);
}

TEST_F(AuthManagerTest, RegisterUser_InvalidInput_CollectsDetails) {
    try {
        authManager_->registerUser("ab", "not-an-email", "12345");
        FAIL() << "expected a ValidationError";
    } catch (const error::ValidationError& e) {
        ASSERT_TRUE(e.details().has_value());
        EXPECT_NE(e.details()->find("Username"), std::string::npos);
        EXPECT_NE(e.details()->find("Email"), std::string::npos);
        EXPECT_NE(e.details()->find("Password"), std::string::npos);
    }
    EXPECT_EQ(users->size(), 0u);
}

TEST_F(AuthManagerTest, Login_Success) {
    const auto reg = authManager_->registerUser("Cooper Test", "a@x.com", "secret1");
    const auto result = authManager_->login("a@x.com", "secret1");
    EXPECT_EQ(result.user->id, reg.user->id);
    EXPECT_EQ(authManager_->tokens().verify(result.token).email, "a@x.com");
}

TEST_F(AuthManagerTest, Login_UnknownEmailAndWrongPassword_LookTheSame) {
    authManager_->registerUser("Cooper Test", "a@x.com", "secret1");

    std::string unknownMsg, wrongMsg;
    try { authManager_->login("b@x.com", "secret1"); } catch (const error::AuthError& e) { unknownMsg = e.what(); }
    try { authManager_->login("a@x.com", "secret2"); } catch (const error::AuthError& e) { wrongMsg = e.what(); }

    EXPECT_EQ(unknownMsg, "Invalid email or password");
    EXPECT_EQ(unknownMsg, wrongMsg);
    EXPECT_EQ(reasonOf([&] { authManager_->login("a@x.com", "secret2"); }), Reason::BadCredentials);
}

TEST_F(AuthManagerTest, Authenticate_ParsesBearerHeader) {
    const auto reg = authManager_->registerUser("Cooper Test", "a@x.com", "secret1");

    EXPECT_EQ(authManager_->authenticate("Bearer " + reg.token).subject_id, reg.user->id);
    EXPECT_EQ(authManager_->authenticate("bearer " + reg.token).subject_id, reg.user->id);
}

TEST_F(AuthManagerTest, Authenticate_MissingOrWrongScheme) {
    const auto reg = authManager_->registerUser("Cooper Test", "a@x.com", "secret1");

    EXPECT_EQ(reasonOf([&] { (void)authManager_->authenticate(""); }), Reason::MissingToken);
    EXPECT_EQ(reasonOf([&] { (void)authManager_->authenticate("Bearer "); }), Reason::MissingToken);
    EXPECT_EQ(reasonOf([&] { (void)authManager_->authenticate("Basic " + reg.token); }), Reason::MissingToken);
    EXPECT_EQ(reasonOf([&] { (void)authManager_->authenticate("Bearer garbage"); }), Reason::TokenInvalid);
}

TEST_F(AuthManagerTest, ResetPassword_RepairsLogin) {
    authManager_->registerUser("Cooper Test", "a@x.com", "secret1");
    authManager_->resetPassword("a@x.com", "newpass1");

    EXPECT_NO_THROW(authManager_->login("a@x.com", "newpass1"));
    EXPECT_THROW(authManager_->login("a@x.com", "secret1"), error::AuthError);
}

TEST_F(AuthManagerTest, ResetPassword_UnknownUserOrShortPassword) {
    EXPECT_THROW(authManager_->resetPassword("nobody@x.com", "newpass1"), error::NotFound);
    authManager_->registerUser("Cooper Test", "a@x.com", "secret1");
    EXPECT_THROW(authManager_->resetPassword("a@x.com", "123"), error::ValidationError);
}

TEST_F(AuthManagerTest, AuditPasswordHashes_FlagsLegacyHashes) {
    authManager_->registerUser("Cooper Test", "a@x.com", "secret1");
    users->put(types::User("legacy-1", "Legacy", "legacy@x.com", "$2b$12$notargon", clock.now()));

    const auto flagged = authManager_->auditPasswordHashes();
    ASSERT_EQ(flagged.size(), 1u);
    EXPECT_EQ(flagged[0]->email, "legacy@x.com");
}

TEST_F(AuthManagerTest, AuthResult_SerializesWithoutHash) {
    const auto reg = authManager_->registerUser("Cooper Test", "a@x.com", "secret1");
    const nlohmann::json j = reg;

    EXPECT_EQ(j.at("token"), reg.token);
    EXPECT_EQ(j.at("user").at("email"), "a@x.com");
    EXPECT_FALSE(j.at("user").contains("password_hash"));
    EXPECT_FALSE(j.at("user").contains("passwordHash"));
}

TEST(AuthValidatorsTest, Email) {
    EXPECT_TRUE(auth::AuthManager::isValidEmail("a@x.com"));
    EXPECT_FALSE(auth::AuthManager::isValidEmail("a@x"));
    EXPECT_FALSE(auth::AuthManager::isValidEmail("@x.com"));
    EXPECT_FALSE(auth::AuthManager::isValidEmail("a@@x.com"));
    EXPECT_FALSE(auth::AuthManager::isValidEmail("a b@x.com"));
}

TEST(AuthValidatorsTest, NameAndPassword) {
    EXPECT_FALSE(auth::AuthManager::isValidName("ab"));
    EXPECT_TRUE(auth::AuthManager::isValidName("abc"));
    EXPECT_FALSE(auth::AuthManager::isValidName(std::string(51, 'a')));
    EXPECT_FALSE(auth::AuthManager::isValidPassword("12345"));
    EXPECT_TRUE(auth::AuthManager::isValidPassword("secret1"));
}
