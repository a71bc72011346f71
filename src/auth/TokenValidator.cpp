#include "auth/TokenValidator.hpp"
#include "crypto/uuid.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <jwt-cpp/jwt.h>
#include <stdexcept>
#include <system_error>

namespace mv::auth {

namespace {

// jwt-cpp clock concept backed by the injected clock
struct ClockAdapter {
    util::Clock clock;
    [[nodiscard]] jwt::date now() const { return clock(); }
};

template <typename Fn>
decltype(auto) withAlgorithm(const TokenValidator::Algorithm alg, const std::string& secret, Fn&& fn) {
    switch (alg) {
    case TokenValidator::Algorithm::HS384: return fn(jwt::algorithm::hs384{secret});
    case TokenValidator::Algorithm::HS512: return fn(jwt::algorithm::hs512{secret});
    case TokenValidator::Algorithm::HS256:
    default: return fn(jwt::algorithm::hs256{secret});
    }
}

}

TokenValidator::Algorithm algorithm_from_string(const std::string& name) {
    if (name == "HS256") return TokenValidator::Algorithm::HS256;
    if (name == "HS384") return TokenValidator::Algorithm::HS384;
    if (name == "HS512") return TokenValidator::Algorithm::HS512;
    throw std::invalid_argument("Unsupported JWT algorithm: " + name);
}

TokenValidator::TokenValidator(const config::AuthConfig& cfg, util::Clock clock)
    : secret_(cfg.jwt_secret),
      algorithm_(algorithm_from_string(cfg.jwt_algorithm)),
      issuer_(cfg.issuer),
      expiry_(cfg.token_expiry_minutes),
      clock_(std::move(clock)) {
    if (secret_.empty()) throw std::invalid_argument("JWT secret must not be empty");
    if (expiry_.count() == 0) throw std::invalid_argument("Token expiry must be positive");
}

std::string TokenValidator::issue(const Claims& claims) const {
    const auto now = std::chrono::time_point_cast<std::chrono::seconds>(clock_());

    return withAlgorithm(algorithm_, secret_, [&](const auto& alg) {
        return jwt::create()
            .set_issuer(issuer_)
            .set_type("JWT")
            .set_subject(claims.subject_id)
            .set_id(ids::uuid4_hex())
            .set_payload_claim("email", jwt::claim(claims.email))
            .set_issued_at(now)
            .set_expires_at(now + expiry_)
            .sign(alg);
    });
}

Claims TokenValidator::verify(const std::string& token) const {
    using error::AuthError;

    const auto decoded = [&] {
        try {
            return jwt::decode(token);
        } catch (const std::exception& e) {
            log::Registry::auth()->debug("[TokenValidator] Malformed token: {}", e.what());
            throw AuthError(AuthError::Reason::TokenInvalid, "Could not validate credentials");
        }
    }();

    std::error_code ec;
    withAlgorithm(algorithm_, secret_, [&](const auto& alg) {
        jwt::verify<ClockAdapter, jwt::traits::kazuho_picojson>(ClockAdapter{clock_})
            .allow_algorithm(alg)
            .with_issuer(issuer_)
            .verify(decoded, ec);
    });

    if (ec == jwt::error::token_verification_error::token_expired) {
        log::Registry::auth()->debug("[TokenValidator] Token expired for subject {}", decoded.get_subject());
        throw AuthError(AuthError::Reason::TokenExpired, "Token has expired");
    }
    if (ec) {
        log::Registry::auth()->warn("[TokenValidator] Token verification failed: {}", ec.message());
        throw AuthError(AuthError::Reason::TokenInvalid, "Could not validate credentials");
    }

    try {
        Claims claims{decoded.get_subject(), {}};
        if (decoded.has_payload_claim("email")) claims.email = decoded.get_payload_claim("email").as_string();
        if (claims.subject_id.empty()) throw std::runtime_error("empty subject");
        if (!decoded.has_expires_at()) throw std::runtime_error("no expiry");
        return claims;
    } catch (const std::exception& e) {
        log::Registry::auth()->warn("[TokenValidator] Token claims unusable: {}", e.what());
        throw AuthError(AuthError::Reason::TokenInvalid, "Could not validate credentials");
    }
}

}
