#include "error/Error.hpp"
#include "util/fileSize.hpp"

#include <fmt/format.h>

namespace mv::error {

Error::Error(const Code code, const std::string& message, std::optional<std::string> details)
    : std::runtime_error(message), code_(code), details_(std::move(details)) {}

std::string_view to_string(const Code code) {
    switch (code) {
    case Code::Validation:         return "VALIDATION_ERROR";
    case Code::UnsupportedType:    return "UNSUPPORTED_MEDIA_TYPE";
    case Code::Unauthorized:       return "UNAUTHORIZED";
    case Code::Forbidden:          return "FORBIDDEN";
    case Code::NotFound:           return "NOT_FOUND";
    case Code::Conflict:           return "ALREADY_EXISTS";
    case Code::PayloadTooLarge:    return "PAYLOAD_TOO_LARGE";
    case Code::BackendUnavailable:
    case Code::Internal:
    default:                       return "INTERNAL_SERVER_ERROR";
    }
}

std::string_view to_string(const AuthError::Reason reason) {
    switch (reason) {
    case AuthError::Reason::MissingToken:   return "MISSING_TOKEN";
    case AuthError::Reason::TokenExpired:   return "TOKEN_EXPIRED";
    case AuthError::Reason::BadCredentials: return "INVALID_CREDENTIALS";
    case AuthError::Reason::TokenInvalid:
    default:                                return "TOKEN_INVALID";
    }
}

PayloadTooLarge::PayloadTooLarge(const uintmax_t size, const uintmax_t limit)
    : Error(Code::PayloadTooLarge,
            fmt::format("File size exceeds maximum allowed size of {}", util::formatFileSize(limit)),
            fmt::format("{} bytes received", size)),
      size_(size), limit_(limit) {}

}
