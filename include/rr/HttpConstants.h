//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpConstants.h
// Purpose: Status code ranges, runtime defaults and fixed diagnostic strings shared across executors.
//==========================================================================================================
#pragma once

#include <cstddef>

namespace rr {
namespace http_status {

constexpr int OK = 200;
constexpr int BAD_REQUEST = 400;
constexpr int UNAUTHORIZED = 401;
constexpr int FORBIDDEN = 403;
constexpr int NOT_FOUND = 404;
constexpr int TOO_MANY_REQUESTS = 429;
constexpr int INTERNAL_SERVER_ERROR = 500;
constexpr int SERVICE_UNAVAILABLE = 503;

constexpr int SUCCESS_MIN = 200;
constexpr int SUCCESS_MAX = 299;
constexpr int CLIENT_ERROR_MIN = 400;
constexpr int CLIENT_ERROR_MAX = 499;
constexpr int SERVER_ERROR_MIN = 500;
constexpr int SERVER_ERROR_MAX = 599;

inline bool IsSuccess(int status) { return status >= SUCCESS_MIN && status <= SUCCESS_MAX; }
inline bool IsClientError(int status) { return status >= CLIENT_ERROR_MIN && status <= CLIENT_ERROR_MAX; }
inline bool IsServerError(int status) { return status >= SERVER_ERROR_MIN && status <= SERVER_ERROR_MAX; }

} // namespace http_status

namespace defaults {

// Circuit breaker
constexpr int CB_FAILURE_THRESHOLD = 5;
constexpr long long CB_RESET_TIMEOUT_MS = 30000;
constexpr long long CB_FAILURE_DECAY_MS = 60000;

// Retry interceptor
constexpr int RETRY_MAX_RETRIES = 3;
constexpr long long RETRY_INITIAL_DELAY_MS = 1000;
constexpr double RETRY_BACKOFF_MULTIPLIER = 2.0;
constexpr long long RETRY_MAX_DELAY_MS = 30000;
constexpr int RETRY_INTERCEPTOR_ORDER = 100;
constexpr int CHAIN_MAX_RETRIES = 3;

// Transport
constexpr unsigned int CONNECT_TIMEOUT_MS = 10000;
constexpr unsigned int READ_TIMEOUT_MS = 30000;

// Client options
constexpr int CLIENT_MAX_RETRIES = 3;
constexpr long long CLIENT_RETRY_DELAY_MS = 1000;
constexpr std::size_t MAX_LOGGED_BODY_LENGTH = 4000;
constexpr std::size_t ASYNC_POOL_SIZE = 4;

} // namespace defaults

namespace messages {

constexpr const char* CIRCUIT_OPEN = "Circuit breaker is open";
constexpr const char* CIRCUIT_OPENED_BY_FAILURE = "Circuit opened due to failure: ";
constexpr const char* CIRCUIT_HALF_OPEN = "Circuit moving to HALF_OPEN state";
constexpr const char* CIRCUIT_CLOSED = "Circuit closed - service appears healthy";
constexpr const char* CIRCUIT_PROBE_FAILED = "Test request failed, circuit remaining open";
constexpr const char* CIRCUIT_PROBE_IN_PROGRESS = "Rejecting request - another test request is in progress";
constexpr const char* CIRCUIT_DECAY = "Reset failure count due to decay timeout";
constexpr const char* TOKEN_EXPIRED = "Token expired or invalid";
constexpr const char* TOKEN_REFRESH_EXHAUSTED = "Token refresh failed after maximum retries";
constexpr const char* HTTP_FAILED_PREFIX = "HTTP request failed with status ";
constexpr const char* MAX_RETRY_EXCEEDED_PREFIX = "Maximum retry count exceeded: ";
constexpr const char* EXECUTOR_SHUT_DOWN = "Executor has been shut down";

} // namespace messages
} // namespace rr
