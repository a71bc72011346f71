#pragma once

#include <sodium.h>
#include <array>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include <stdexcept>

namespace mv::ids {

// ---------- sodium init (thread-safe, idempotent)
inline void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

// ---------- RFC 4122 v4 UUID (hex string)
inline std::string uuid4_hex() {
    ensure_sodium_init();
    std::array<uint8_t, 16> b{};
    randombytes_buf(b.data(), b.size());
    b[6] = (b[6] & 0x0F) | 0x40; // version 4
    b[8] = (b[8] & 0x3F) | 0x80; // variant

    char s[37];
    std::snprintf(s, sizeof s,
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
        b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return {s};
}

// ---------- Lowercase hex of `bytes` random bytes (2*bytes chars)
inline std::string random_hex(const size_t bytes) {
    ensure_sodium_init();
    std::vector<uint8_t> buf(bytes);
    randombytes_buf(buf.data(), buf.size());

    std::string out(bytes * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), buf.data(), buf.size());
    out.resize(bytes * 2);
    return out;
}

}
