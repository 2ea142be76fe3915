#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace steadfast {

/**
 * @brief Error codes carried by every resilience-core exception
 */
enum class ErrorCode {
    NONE,
    CIRCUIT_OPEN,
    CIRCUIT_TIMEOUT,
    DATABASE_ERROR,
    INVALID_IDENTIFIER,
    NOT_INITIALIZED,
    HTTP_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_code_to_string(ErrorCode c) noexcept {
    switch (c) {
        case ErrorCode::NONE:               return "NONE";
        case ErrorCode::CIRCUIT_OPEN:       return "CIRCUIT_OPEN";
        case ErrorCode::CIRCUIT_TIMEOUT:    return "CIRCUIT_TIMEOUT";
        case ErrorCode::DATABASE_ERROR:     return "DATABASE_ERROR";
        case ErrorCode::INVALID_IDENTIFIER: return "INVALID_IDENTIFIER";
        case ErrorCode::NOT_INITIALIZED:    return "NOT_INITIALIZED";
        case ErrorCode::HTTP_ERROR:         return "HTTP_ERROR";
        case ErrorCode::INTERNAL_ERROR:     return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Base class for errors raised by the resilience core
 */
class ResilienceError : public std::runtime_error {
public:
    ResilienceError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Raised when a breaker rejects a call without invoking it
 */
class CircuitOpenError : public ResilienceError {
public:
    explicit CircuitOpenError(std::string breaker)
        : ResilienceError(ErrorCode::CIRCUIT_OPEN, "Circuit breaker is OPEN: " + breaker),
          breaker_(std::move(breaker)) {}

    [[nodiscard]] const std::string& breaker() const noexcept { return breaker_; }

private:
    std::string breaker_;
};

/**
 * @brief Raised when a protected call does not finish within the breaker timeout
 */
class CircuitTimeoutError : public ResilienceError {
public:
    explicit CircuitTimeoutError(std::string breaker)
        : ResilienceError(ErrorCode::CIRCUIT_TIMEOUT, "Circuit breaker timeout: " + breaker),
          breaker_(std::move(breaker)) {}

    [[nodiscard]] const std::string& breaker() const noexcept { return breaker_; }

private:
    std::string breaker_;
};

/**
 * @brief Database failure, optionally carrying the server SQLSTATE
 */
class DatabaseError : public ResilienceError {
public:
    explicit DatabaseError(const std::string& message, std::string sqlstate = {})
        : ResilienceError(ErrorCode::DATABASE_ERROR, message),
          sqlstate_(std::move(sqlstate)) {}

    [[nodiscard]] const std::string& sqlstate() const noexcept { return sqlstate_; }

private:
    std::string sqlstate_;
};

/**
 * @brief Table or column name rejected by the identifier guard
 */
class InvalidIdentifierError : public ResilienceError {
public:
    explicit InvalidIdentifierError(const std::string& message)
        : ResilienceError(ErrorCode::INVALID_IDENTIFIER, message) {}
};

class NotInitializedError : public ResilienceError {
public:
    explicit NotInitializedError(const std::string& message)
        : ResilienceError(ErrorCode::NOT_INITIALIZED, message) {}
};

/**
 * @brief HTTP-level failure reported by an external API collaborator
 */
class HttpStatusError : public ResilienceError {
public:
    HttpStatusError(int status, const std::string& message)
        : ResilienceError(ErrorCode::HTTP_ERROR, message), status_(status) {}

    [[nodiscard]] int status() const noexcept { return status_; }

private:
    int status_;
};

} // namespace steadfast
