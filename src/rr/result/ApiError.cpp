//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ApiError.cpp
// Purpose: ApiError factories and text rendering
//==========================================================================================================

#include "rr/result/ApiError.h"

#include <utility>

#include <fmt/format.h>

namespace rr {

const char* ToString(ErrorType type) {
    switch (type) {
        case ErrorType::HttpError: return "HTTP_ERROR";
        case ErrorType::AuthError: return "AUTH_ERROR";
        case ErrorType::NetworkError: return "NETWORK_ERROR";
        case ErrorType::CircuitOpen: return "CIRCUIT_OPEN";
        case ErrorType::ConfigError: return "CONFIG_ERROR";
    }
    return "UNKNOWN";
}

namespace {
ApiError make(ErrorType type, int statusCode, const std::string& message, std::optional<std::string> body) {
    ApiError e;
    e.type = type;
    e.statusCode = statusCode;
    e.message = message;
    e.responseBody = std::move(body);
    return e;
}
} // namespace

ApiError ApiError::Http(int statusCode, const std::string& message, std::optional<std::string> body) {
    return make(ErrorType::HttpError, statusCode, message, std::move(body));
}

ApiError ApiError::Auth(int statusCode, const std::string& message, std::optional<std::string> body) {
    return make(ErrorType::AuthError, statusCode, message, std::move(body));
}

ApiError ApiError::Network(const std::string& message, int statusCode, std::optional<std::string> body) {
    return make(ErrorType::NetworkError, statusCode, message, std::move(body));
}

ApiError ApiError::CircuitOpen(const std::string& message, int statusCode, std::optional<std::string> body) {
    return make(ErrorType::CircuitOpen, statusCode, message, std::move(body));
}

ApiError ApiError::Config(const std::string& message, int statusCode, std::optional<std::string> body) {
    return make(ErrorType::ConfigError, statusCode, message, std::move(body));
}

std::string ApiError::ToString() const {
    if (statusCode > 0) {
        return fmt::format("{}: {} (Status: {})", rr::ToString(type), message, statusCode);
    }
    return fmt::format("{}: {}", rr::ToString(type), message);
}

} // namespace rr
