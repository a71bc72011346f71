#include "crypto/PasswordHash.hpp"
#include "crypto/uuid.hpp"

#include <sodium.h>
#include <stdexcept>

namespace mv::crypto {

std::string hashPassword(const std::string& password, const PasswordHashLimits& limits) {
    ids::ensure_sodium_init();
    char hashed[crypto_pwhash_STRBYTES];

    if (crypto_pwhash_str(hashed, password.c_str(), password.size(), limits.ops_limit, limits.mem_limit) != 0)
        throw std::runtime_error("Password hashing failed (out of memory?)");

    return {hashed};
}

bool verifyPassword(const std::string& password, const std::string& hash) {
    if (hash.empty() || hash.size() >= crypto_pwhash_STRBYTES) return false;
    ids::ensure_sodium_init();
    return crypto_pwhash_str_verify(hash.c_str(), password.c_str(), password.size()) == 0;
}

bool isPasswordHash(const std::string& hash) {
    return hash.size() < crypto_pwhash_STRBYTES &&
           (hash.starts_with("$argon2id$") || hash.starts_with("$argon2i$"));
}

}
