#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace mv::error {

enum class Code {
    Validation,
    UnsupportedType,
    Unauthorized,
    Forbidden,
    NotFound,
    Conflict,
    PayloadTooLarge,
    BackendUnavailable,
    Internal
};

// Wire code used in the error envelope
std::string_view to_string(Code code);

class Error : public std::runtime_error {
public:
    Error(Code code, const std::string& message, std::optional<std::string> details = std::nullopt);

    [[nodiscard]] Code code() const noexcept { return code_; }
    [[nodiscard]] const std::optional<std::string>& details() const noexcept { return details_; }

private:
    Code code_;
    std::optional<std::string> details_;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message, std::optional<std::string> details = std::nullopt)
        : Error(Code::Validation, message, std::move(details)) {}

protected:
    ValidationError(Code code, const std::string& message) : Error(code, message) {}
};

class UnsupportedType : public ValidationError {
public:
    explicit UnsupportedType(const std::string& contentType)
        : ValidationError(Code::UnsupportedType, "File type " + contentType + " is not allowed"),
          content_type_(contentType) {}

    [[nodiscard]] const std::string& contentType() const noexcept { return content_type_; }

private:
    std::string content_type_;
};

class AuthError : public Error {
public:
    enum class Reason { MissingToken, TokenInvalid, TokenExpired, BadCredentials };

    AuthError(Reason reason, const std::string& message) : Error(Code::Unauthorized, message), reason_(reason) {}

    [[nodiscard]] Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

std::string_view to_string(AuthError::Reason reason);

class Forbidden : public Error {
public:
    explicit Forbidden(const std::string& message) : Error(Code::Forbidden, message) {}
};

class NotFound : public Error {
public:
    explicit NotFound(const std::string& message) : Error(Code::NotFound, message) {}
};

class Conflict : public Error {
public:
    explicit Conflict(const std::string& message) : Error(Code::Conflict, message) {}
};

class PayloadTooLarge : public Error {
public:
    PayloadTooLarge(uintmax_t size, uintmax_t limit);

    [[nodiscard]] uintmax_t size() const noexcept { return size_; }
    [[nodiscard]] uintmax_t limit() const noexcept { return limit_; }

private:
    uintmax_t size_, limit_;
};

class BackendUnavailable : public Error {
public:
    BackendUnavailable(const std::string& backend, const std::string& detail)
        : Error(Code::BackendUnavailable, backend + " unavailable", detail) {}
};

}
