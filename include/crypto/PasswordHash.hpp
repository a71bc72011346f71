#pragma once

#include <cstddef>
#include <string>

namespace mv::crypto {

struct PasswordHashLimits {
    unsigned long long ops_limit;
    size_t mem_limit;
};

// Hashes a password with Argon2id using libsodium
std::string hashPassword(const std::string& password, const PasswordHashLimits& limits);

// Verifies a password against a given Argon2id hash; false for malformed hashes
bool verifyPassword(const std::string& password, const std::string& hash);

// True when the stored string is a libsodium Argon2 encoding
bool isPasswordHash(const std::string& hash);

} // namespace mv::crypto
