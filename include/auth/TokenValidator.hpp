#pragma once

#include "config/Config.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <string>

namespace mv::auth {

struct Claims {
    std::string subject_id;
    std::string email;
};

// Signed bearer tokens (HS256/384/512). Expiry is the only invalidation mechanism.
class TokenValidator {
public:
    enum class Algorithm { HS256, HS384, HS512 };

    explicit TokenValidator(const config::AuthConfig& cfg, util::Clock clock = util::systemNow);

    [[nodiscard]] std::string issue(const Claims& claims) const;

    // Throws error::AuthError with TokenExpired or TokenInvalid
    [[nodiscard]] Claims verify(const std::string& token) const;

    [[nodiscard]] std::chrono::minutes expiry() const { return expiry_; }

private:
    std::string secret_;
    Algorithm algorithm_;
    std::string issuer_;
    std::chrono::minutes expiry_;
    util::Clock clock_;
};

TokenValidator::Algorithm algorithm_from_string(const std::string& name);

}
