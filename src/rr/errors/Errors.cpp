//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Constructors and helpers of the failure hierarchy
//==========================================================================================================

#include "rr/errors/Errors.h"

#include <utility>

#include "rr/HttpConstants.h"

namespace rr {
namespace errors {

const char* ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::HttpError: return "HTTP_ERROR";
        case FailureKind::Unauthorized: return "UNAUTHORIZED";
        case FailureKind::CircuitOpen: return "CIRCUIT_OPEN";
        case FailureKind::Network: return "NETWORK";
        case FailureKind::Config: return "CONFIG";
    }
    return "UNKNOWN";
}

TransportError::TransportError(const std::string& message,
                               int statusCode,
                               std::optional<std::string> responseBody,
                               FailureKind kind,
                               std::exception_ptr cause)
    : std::runtime_error(message),
      statusCode(statusCode),
      responseBody(std::move(responseBody)),
      kind(kind),
      cause(std::move(cause)) {}

TokenExpiredException::TokenExpiredException(const std::string& message,
                                             std::optional<std::string> responseBody)
    : TransportError(message, http_status::UNAUTHORIZED, std::move(responseBody), FailureKind::Unauthorized) {}

TokenRefreshExhaustedException::TokenRefreshExhaustedException(const std::string& message,
                                                               std::exception_ptr lastFailure)
    : TransportError(message, http_status::UNAUTHORIZED, std::nullopt, FailureKind::Unauthorized,
                     std::move(lastFailure)) {}

CircuitBreakerOpenException::CircuitBreakerOpenException(const std::string& message,
                                                         long long millisSinceLastFailure,
                                                         long long resetTimeoutMs,
                                                         bool trippedByThisRequest,
                                                         std::exception_ptr cause)
    : TransportError(message, 0, std::nullopt, FailureKind::CircuitOpen, std::move(cause)),
      millisSinceLastFailure(millisSinceLastFailure),
      resetTimeoutMs(resetTimeoutMs),
      tripped(trippedByThisRequest) {}

long long CircuitBreakerOpenException::EstimatedMillisUntilReset() const noexcept {
    const long long remaining = resetTimeoutMs - millisSinceLastFailure;
    return remaining > 0 ? remaining : 0;
}

NetworkException::NetworkException(const std::string& message, std::exception_ptr cause)
    : TransportError(message, 0, std::nullopt, FailureKind::Network, std::move(cause)) {}

ConfigException::ConfigException(const std::string& message)
    : TransportError(message, 0, std::nullopt, FailureKind::Config) {}

} // namespace errors
} // namespace rr
