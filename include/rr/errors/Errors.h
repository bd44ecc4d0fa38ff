//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed failure hierarchy raised by executors, decorators and the request orchestrator
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace rr {
namespace errors {

// Closed set of failure categories every layer agrees on.
enum class FailureKind {
    HttpError,
    Unauthorized,
    CircuitOpen,
    Network,
    Config
};

const char* ToString(FailureKind kind);

//==========================================================================================================
// TransportError
// Purpose: Base failure of a single request execution. Carries the HTTP status (0 when no response was
//          received), the response body when one was read, the failure kind and an optional cause.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& message,
                   int statusCode = 0,
                   std::optional<std::string> responseBody = std::nullopt,
                   FailureKind kind = FailureKind::HttpError,
                   std::exception_ptr cause = nullptr);

    int StatusCode() const noexcept { return statusCode; }
    const std::optional<std::string>& ResponseBody() const noexcept { return responseBody; }
    FailureKind Kind() const noexcept { return kind; }
    std::exception_ptr Cause() const noexcept { return cause; }

    //==========================================================================================================
    // Raise
    // Purpose: Rethrows this failure preserving its dynamic type. Layers that only hold a base reference
    //          (interceptors, decorators) use it to propagate the original exception unchanged.
    //==========================================================================================================
    [[noreturn]] virtual void Raise() const { throw *this; }

private:
    int statusCode;
    std::optional<std::string> responseBody;
    FailureKind kind;
    std::exception_ptr cause;
};

// HTTP 401 reported by a transport.
class TokenExpiredException : public TransportError {
public:
    explicit TokenExpiredException(const std::string& message,
                                   std::optional<std::string> responseBody = std::nullopt);
    [[noreturn]] void Raise() const override { throw *this; }
};

// Terminal authentication failure once the orchestrator has spent its refresh attempts.
class TokenRefreshExhaustedException : public TransportError {
public:
    TokenRefreshExhaustedException(const std::string& message, std::exception_ptr lastFailure);
    [[noreturn]] void Raise() const override { throw *this; }
};

//==========================================================================================================
// CircuitBreakerOpenException
// Purpose: Raised when the circuit breaker rejects a request, or when a request's own failure tripped the
//          breaker (TrippedByThisRequest() is then true and Cause() holds the original failure).
//==========================================================================================================
class CircuitBreakerOpenException : public TransportError {
public:
    CircuitBreakerOpenException(const std::string& message,
                                long long millisSinceLastFailure,
                                long long resetTimeoutMs,
                                bool trippedByThisRequest = false,
                                std::exception_ptr cause = nullptr);

    long long MillisSinceLastFailure() const noexcept { return millisSinceLastFailure; }
    long long ResetTimeoutMs() const noexcept { return resetTimeoutMs; }
    long long EstimatedMillisUntilReset() const noexcept;
    bool TrippedByThisRequest() const noexcept { return tripped; }

    [[noreturn]] void Raise() const override { throw *this; }

private:
    long long millisSinceLastFailure;
    long long resetTimeoutMs;
    bool tripped;
};

// No response was obtained: resolve, connect, TLS, read or timeout failures.
class NetworkException : public TransportError {
public:
    explicit NetworkException(const std::string& message, std::exception_ptr cause = nullptr);
    [[noreturn]] void Raise() const override { throw *this; }
};

// The request or client configuration is invalid; no I/O was attempted.
class ConfigException : public TransportError {
public:
    explicit ConfigException(const std::string& message);
    [[noreturn]] void Raise() const override { throw *this; }
};

} // namespace errors

using errors::FailureKind;
using errors::TransportError;

} // namespace rr
