//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/ClientOptions.cpp
// Purpose: Config-string and environment parsing for ClientOptions
//==========================================================================================================

#include "rr/ClientOptions.hpp"

#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace rr {

namespace {

std::string trim(std::string s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

bool parseBool(const std::string& key, const std::string& val, bool& out) {
    if (val == "1" || val == "true" || val == "TRUE" || val == "yes") {
        out = true;
        return true;
    }
    if (val == "0" || val == "false" || val == "FALSE" || val == "no") {
        out = false;
        return true;
    }
    LOG_WARN("Ignoring option {}: '{}' is not a boolean", key, val);
    return false;
}

template <typename T>
bool parseNumber(const std::string& key, const std::string& val, T& out) {
    try {
        std::size_t pos = 0;
        const long long n = std::stoll(val, &pos);
        if (pos != val.size() || n < 0) {
            LOG_WARN("Ignoring option {}: '{}' is not a non-negative whole number", key, val);
            return false;
        }
        out = static_cast<T>(n);
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring option {}: '{}' ({})", key, val, e.what());
        return false;
    }
}

void applyPolicy(const std::string& key, const std::string& val, CircuitBreakerExecutor::FailurePolicy& out) {
    auto policy = FailurePolicyFromString(val);
    if (!policy) {
        LOG_WARN("Ignoring option {}: unknown failure policy '{}'", key, val);
        return;
    }
    out = *policy;
}

} // namespace

ClientOptions ClientOptions::FromConfigString(const std::string& config) {
    ClientOptions opts;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        start = sep + 1;
        if (kv.empty()) {
            continue;
        }
        std::size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("Ignoring malformed option '{}'", kv);
            continue;
        }
        const std::string key = trim(kv.substr(0, eq));
        const std::string val = trim(kv.substr(eq + 1));

        if (key == "retry.enabled") {
            parseBool(key, val, opts.retryEnabled);
        }
        else if (key == "retry.max") {
            parseNumber(key, val, opts.maxRetries);
        }
        else if (key == "retry.delay") {
            parseNumber(key, val, opts.retryDelayMs);
        }
        else if (key == "logging.enabled") {
            parseBool(key, val, opts.loggingEnabled);
        }
        else if (key == "timing.enabled") {
            parseBool(key, val, opts.timingEnabled);
        }
        else if (key == "logging.request.body") {
            parseBool(key, val, opts.logRequestBody);
        }
        else if (key == "logging.response.body") {
            parseBool(key, val, opts.logResponseBody);
        }
        else if (key == "logging.response.raw") {
            parseBool(key, val, opts.logRawResponse);
        }
        else if (key == "logging.body.maxlength") {
            parseNumber(key, val, opts.maxLoggedBodyLength);
        }
        else if (key == "async.pool.size") {
            parseNumber(key, val, opts.asyncPoolSize);
        }
        else if (key == "connectTimeoutMs") {
            parseNumber(key, val, opts.connectTimeoutMs);
        }
        else if (key == "readTimeoutMs") {
            parseNumber(key, val, opts.readTimeoutMs);
        }
        else if (key == "caFile") {
            opts.caFile = val;
        }
        else if (key == "caPath") {
            opts.caPath = val;
        }
        else if (key == "circuit_breaker.enabled") {
            parseBool(key, val, opts.circuitBreakerEnabled);
        }
        else if (key == "circuit_breaker.failure_threshold") {
            parseNumber(key, val, opts.circuitBreakerFailureThreshold);
        }
        else if (key == "circuit_breaker.reset_timeout_ms") {
            parseNumber(key, val, opts.circuitBreakerResetTimeoutMs);
        }
        else if (key == "circuit_breaker.failure_decay_ms") {
            parseNumber(key, val, opts.circuitBreakerFailureDecayMs);
        }
        else if (key == "circuit_breaker.failure_policy") {
            applyPolicy(key, val, opts.circuitBreakerFailurePolicy);
        }
        else {
            LOG_WARN("Ignoring unknown option '{}'", key);
        }
    }
    return opts;
}

ClientOptions& ClientOptions::ApplyEnvironment() {
    if (auto v = GetEnvInt("RR_MAX_RETRIES"); v && *v >= 0) {
        maxRetries = static_cast<int>(*v);
    }
    if (auto v = GetEnvInt("RR_RETRY_DELAY_MS"); v && *v >= 0) {
        retryDelayMs = *v;
    }
    if (auto v = GetEnvInt("RR_CONNECT_TIMEOUT_MS"); v && *v > 0) {
        connectTimeoutMs = static_cast<unsigned int>(*v);
    }
    if (auto v = GetEnvInt("RR_READ_TIMEOUT_MS"); v && *v > 0) {
        readTimeoutMs = static_cast<unsigned int>(*v);
    }
    if (auto v = GetEnvInt("RR_ASYNC_POOL_SIZE"); v && *v > 0) {
        asyncPoolSize = static_cast<std::size_t>(*v);
    }
    circuitBreakerEnabled = GetEnvBoolOrDefault("RR_CB_ENABLED", circuitBreakerEnabled);
    if (auto v = GetEnvInt("RR_CB_THRESHOLD"); v && *v >= 1) {
        circuitBreakerFailureThreshold = static_cast<int>(*v);
    }
    if (auto v = GetEnvInt("RR_CB_RESET_TIMEOUT_MS"); v && *v >= 0) {
        circuitBreakerResetTimeoutMs = *v;
    }
    if (auto v = GetEnvInt("RR_CB_FAILURE_DECAY_MS"); v && *v >= 0) {
        circuitBreakerFailureDecayMs = *v;
    }
    const std::string policy = GetEnvOrDefault("RR_CB_POLICY", "");
    if (!policy.empty()) {
        applyPolicy("RR_CB_POLICY", policy, circuitBreakerFailurePolicy);
    }
    return *this;
}

CircuitBreakerExecutor::Options ClientOptions::BreakerOptions() const {
    CircuitBreakerExecutor::Options o;
    o.failureThreshold = circuitBreakerFailureThreshold;
    o.resetTimeout = std::chrono::milliseconds(circuitBreakerResetTimeoutMs);
    o.failureDecay = std::chrono::milliseconds(circuitBreakerFailureDecayMs);
    o.policy = circuitBreakerFailurePolicy;
    return o;
}

} // namespace rr
