#include <gtest/gtest.h>
#include "crypto/PasswordHash.hpp"

#include <sodium.h>

using namespace mv::crypto;

namespace {
const PasswordHashLimits FAST{crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
}

TEST(PasswordHashTest, SamePassword_DistinctSaltsBothVerify) {
    const auto a = hashPassword("secret1", FAST);
    const auto b = hashPassword("secret1", FAST);
    EXPECT_NE(a, b);
    EXPECT_TRUE(verifyPassword("secret1", a));
    EXPECT_TRUE(verifyPassword("secret1", b));
}

TEST(PasswordHashTest, WrongPassword_DoesNotVerify) {
    const auto h = hashPassword("secret1", FAST);
    EXPECT_FALSE(verifyPassword("secret2", h));
    EXPECT_FALSE(verifyPassword("", h));
}

TEST(PasswordHashTest, MalformedHash_ReturnsFalse) {
    EXPECT_FALSE(verifyPassword("secret1", ""));
    EXPECT_FALSE(verifyPassword("secret1", "plaintext"));
    EXPECT_FALSE(verifyPassword("secret1", "$argon2id$v=19$garbage"));
    EXPECT_FALSE(verifyPassword("secret1", std::string(crypto_pwhash_STRBYTES + 10, 'x')));
}

TEST(PasswordHashTest, IsPasswordHash_RecognisesArgonEncodings) {
    EXPECT_TRUE(isPasswordHash(hashPassword("secret1", FAST)));
    EXPECT_FALSE(isPasswordHash("$2b$12$abcdefghijklmnopqrstuv"));
    EXPECT_FALSE(isPasswordHash(""));
}
