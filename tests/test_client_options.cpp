//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client_options.cpp
// Purpose: GoogleTests for ClientOptions config-string and environment parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>

#include "rr/ClientOptions.hpp"

using namespace rr;
using Policy = CircuitBreakerExecutor::FailurePolicy;

TEST(ClientOptions, Defaults) {
    ClientOptions o;
    EXPECT_TRUE(o.retryEnabled);
    EXPECT_EQ(o.maxRetries, defaults::CLIENT_MAX_RETRIES);
    EXPECT_EQ(o.retryDelayMs, defaults::CLIENT_RETRY_DELAY_MS);
    EXPECT_FALSE(o.circuitBreakerEnabled);
    EXPECT_EQ(o.asyncPoolSize, defaults::ASYNC_POOL_SIZE);
}

TEST(ClientOptions, ParsesConfigString) {
    ClientOptions o = ClientOptions::FromConfigString(
        "retry.enabled=false; retry.max=5; retry.delay=250; logging.request.body=true;"
        " logging.body.maxlength=64; async.pool.size=8; connectTimeoutMs=1500; readTimeoutMs=2500;"
        " caFile=/etc/ssl/ca.pem; circuit_breaker.enabled=yes; circuit_breaker.failure_threshold=3;"
        " circuit_breaker.reset_timeout_ms=1000; circuit_breaker.failure_decay_ms=9000;"
        " circuit_breaker.failure_policy=server_errors_only");
    EXPECT_FALSE(o.retryEnabled);
    EXPECT_EQ(o.maxRetries, 5);
    EXPECT_EQ(o.retryDelayMs, 250);
    EXPECT_TRUE(o.logRequestBody);
    EXPECT_EQ(o.maxLoggedBodyLength, 64u);
    EXPECT_EQ(o.asyncPoolSize, 8u);
    EXPECT_EQ(o.connectTimeoutMs, 1500u);
    EXPECT_EQ(o.readTimeoutMs, 2500u);
    EXPECT_EQ(o.caFile, "/etc/ssl/ca.pem");
    EXPECT_TRUE(o.circuitBreakerEnabled);
    EXPECT_EQ(o.circuitBreakerFailureThreshold, 3);
    EXPECT_EQ(o.circuitBreakerResetTimeoutMs, 1000);
    EXPECT_EQ(o.circuitBreakerFailureDecayMs, 9000);
    EXPECT_EQ(o.circuitBreakerFailurePolicy, Policy::ServerErrorsOnly);
}

TEST(ClientOptions, SkipsInvalidEntries) {
    ClientOptions o = ClientOptions::FromConfigString(
        "retry.max=-1; retry.delay=10ms; retry.enabled=maybe; no_equals; bogus.key=1;;"
        " circuit_breaker.failure_policy=sometimes; timing.enabled=0");
    ClientOptions d;
    EXPECT_EQ(o.maxRetries, d.maxRetries);
    EXPECT_EQ(o.retryDelayMs, d.retryDelayMs);
    EXPECT_EQ(o.retryEnabled, d.retryEnabled);
    EXPECT_EQ(o.circuitBreakerFailurePolicy, d.circuitBreakerFailurePolicy);
    EXPECT_FALSE(o.timingEnabled);
}

TEST(ClientOptions, EnvironmentOverlay) {
    ::setenv("RR_MAX_RETRIES", "7", 1);
    ::setenv("RR_RETRY_DELAY_MS", "0", 1);
    ::setenv("RR_CB_ENABLED", "true", 1);
    ::setenv("RR_CB_THRESHOLD", "0", 1); // below minimum, ignored
    ::setenv("RR_CB_POLICY", "EXCLUDE_CLIENT_ERRORS", 1);
    ::setenv("RR_ASYNC_POOL_SIZE", "abc", 1);
    ::setenv("RR_CB_FAILURE_DECAY_MS", "4500", 1);

    ClientOptions o;
    o.ApplyEnvironment();
    EXPECT_EQ(o.maxRetries, 7);
    EXPECT_EQ(o.retryDelayMs, 0);
    EXPECT_TRUE(o.circuitBreakerEnabled);
    EXPECT_EQ(o.circuitBreakerFailureThreshold, defaults::CB_FAILURE_THRESHOLD);
    EXPECT_EQ(o.circuitBreakerFailurePolicy, Policy::ExcludeClientErrors);
    EXPECT_EQ(o.asyncPoolSize, defaults::ASYNC_POOL_SIZE);
    EXPECT_EQ(o.circuitBreakerFailureDecayMs, 4500);
    EXPECT_EQ(o.BreakerOptions().failureDecay.count(), 4500);

    for (const char* name : {"RR_MAX_RETRIES", "RR_RETRY_DELAY_MS", "RR_CB_ENABLED", "RR_CB_THRESHOLD",
                             "RR_CB_POLICY", "RR_ASYNC_POOL_SIZE", "RR_CB_FAILURE_DECAY_MS"}) {
        ::unsetenv(name);
    }
}

TEST(ClientOptions, BreakerOptionsMirrorFields) {
    ClientOptions o;
    o.circuitBreakerFailureThreshold = 4;
    o.circuitBreakerResetTimeoutMs = 1234;
    o.circuitBreakerFailureDecayMs = 5678;
    o.circuitBreakerFailurePolicy = Policy::ExcludeClientErrors;
    auto b = o.BreakerOptions();
    EXPECT_EQ(b.failureThreshold, 4);
    EXPECT_EQ(b.resetTimeout.count(), 1234);
    EXPECT_EQ(b.failureDecay.count(), 5678);
    EXPECT_EQ(b.policy, Policy::ExcludeClientErrors);
    EXPECT_FALSE(b.predicate);
}
