//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ApiError.h
// Purpose: Classified failure value returned by the exception-free execution mode
//==========================================================================================================
#pragma once

#include <optional>
#include <string>

namespace rr {

enum class ErrorType {
    HttpError,
    AuthError,
    NetworkError,
    CircuitOpen,
    ConfigError
};

const char* ToString(ErrorType type);

//==========================================================================================================
// ApiError
// Purpose: Failure description carrying the same message, status code and response body as the exception
//          it was derived from, so either form can be rebuilt from the other.
// Fields:
//   type: Failure classification.
//   statusCode: HTTP status, or 0 when no response was received.
//   message: Human readable description.
//   responseBody: Body of the failing response when one was read.
//==========================================================================================================
struct ApiError {
    ErrorType type{ErrorType::HttpError};
    int statusCode{0};
    std::string message;
    std::optional<std::string> responseBody;

    static ApiError Http(int statusCode, const std::string& message, std::optional<std::string> body = std::nullopt);
    static ApiError Auth(int statusCode, const std::string& message, std::optional<std::string> body = std::nullopt);
    static ApiError Network(const std::string& message, int statusCode = 0,
                            std::optional<std::string> body = std::nullopt);
    static ApiError CircuitOpen(const std::string& message, int statusCode = 0,
                                std::optional<std::string> body = std::nullopt);
    static ApiError Config(const std::string& message, int statusCode = 0,
                           std::optional<std::string> body = std::nullopt);

    bool Is(ErrorType t) const { return type == t; }
    bool HasStatusCode(int code) const { return statusCode == code; }

    // "HTTP_ERROR: Not found (Status: 404)"
    std::string ToString() const;
};

} // namespace rr
