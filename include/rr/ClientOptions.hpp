//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/ClientOptions.hpp
// Purpose: Static client knobs read once when a client is built
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "rr/CircuitBreakerExecutor.hpp"
#include "rr/HttpConstants.h"

namespace rr {

//==========================================================================================================
// ClientOptions
// Purpose: Retry, logging, timing, transport and circuit breaker settings.
// Fields:
//   retryEnabled/maxRetries/retryDelayMs: Authorization refresh loop of the orchestrator.
//   loggingEnabled/timingEnabled: Request and elapsed-time log lines.
//   logRequestBody/logResponseBody/logRawResponse/maxLoggedBodyLength: Payload logging.
//   asyncPoolSize: Worker threads of the async view.
//   connectTimeoutMs/readTimeoutMs/caFile/caPath: HttpExecutor transport settings.
//   circuitBreaker*: Circuit breaker enablement and thresholds.
//==========================================================================================================
struct ClientOptions {
    bool retryEnabled{true};
    int maxRetries{defaults::CLIENT_MAX_RETRIES};
    long long retryDelayMs{defaults::CLIENT_RETRY_DELAY_MS};

    bool loggingEnabled{true};
    bool timingEnabled{true};
    bool logRequestBody{false};
    bool logResponseBody{false};
    bool logRawResponse{true};
    std::size_t maxLoggedBodyLength{defaults::MAX_LOGGED_BODY_LENGTH};

    std::size_t asyncPoolSize{defaults::ASYNC_POOL_SIZE};

    unsigned int connectTimeoutMs{defaults::CONNECT_TIMEOUT_MS};
    unsigned int readTimeoutMs{defaults::READ_TIMEOUT_MS};
    std::string caFile;
    std::string caPath;

    bool circuitBreakerEnabled{false};
    int circuitBreakerFailureThreshold{defaults::CB_FAILURE_THRESHOLD};
    long long circuitBreakerResetTimeoutMs{defaults::CB_RESET_TIMEOUT_MS};
    long long circuitBreakerFailureDecayMs{defaults::CB_FAILURE_DECAY_MS};
    CircuitBreakerExecutor::FailurePolicy circuitBreakerFailurePolicy{CircuitBreakerExecutor::FailurePolicy::AllExceptions};

    //==========================================================================================================
    // FromConfigString
    // Purpose: Parses "key=value; key=value" on top of the defaults. Keys: retry.enabled, retry.max,
    //          retry.delay, logging.enabled, timing.enabled, logging.request.body, logging.response.body,
    //          logging.response.raw, logging.body.maxlength, async.pool.size, connectTimeoutMs,
    //          readTimeoutMs, caFile, caPath, circuit_breaker.enabled, circuit_breaker.failure_threshold,
    //          circuit_breaker.reset_timeout_ms, circuit_breaker.failure_decay_ms,
    //          circuit_breaker.failure_policy. Unknown keys and malformed values are logged and skipped.
    //==========================================================================================================
    static ClientOptions FromConfigString(const std::string& config);

    //==========================================================================================================
    // ApplyEnvironment
    // Purpose: Overlays RR_MAX_RETRIES, RR_RETRY_DELAY_MS, RR_CONNECT_TIMEOUT_MS, RR_READ_TIMEOUT_MS,
    //          RR_ASYNC_POOL_SIZE, RR_CB_ENABLED, RR_CB_THRESHOLD, RR_CB_RESET_TIMEOUT_MS and RR_CB_POLICY.
    //==========================================================================================================
    ClientOptions& ApplyEnvironment();

    // Circuit breaker settings in the form CircuitBreakerExecutor expects.
    CircuitBreakerExecutor::Options BreakerOptions() const;
};

} // namespace rr
