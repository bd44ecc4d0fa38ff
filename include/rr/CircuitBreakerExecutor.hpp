//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/CircuitBreakerExecutor.hpp
// Purpose: Circuit breaker decorator with a lock-free CLOSED/OPEN/HALF_OPEN state machine
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>

#include "rr/Executor.h"
#include "rr/HttpConstants.h"

namespace rr {

//==========================================================================================================
// CircuitBreakerExecutor
// Purpose: Wraps an executor and stops calling it while it is considered unhealthy.
// Notes:
//   - Phase, probe flag and consecutive failure count share one atomic word; every transition is a
//     compare-and-swap and losers re-read the current word. Execute() takes no lock.
//   - A failure that trips the breaker reaches the caller as CircuitBreakerOpenException with
//     TrippedByThisRequest() == true and the original failure as Cause(). Later rejections carry false.
//   - While HALF_OPEN exactly one probe is let through; concurrent callers are rejected, not queued.
//==========================================================================================================
class CircuitBreakerExecutor : public IExecutor {
public:
    enum class State {
        Closed,
        Open,
        HalfOpen
    };

    enum class FailurePolicy {
        AllExceptions,       // every TransportError counts
        ServerErrorsOnly,    // 5xx only
        ExcludeClientErrors, // anything but 4xx
        Custom               // Options::predicate decides
    };

    using FailurePredicate = std::function<bool(const errors::TransportError&)>;

    // Monotonic milliseconds. Replaceable for deterministic tests.
    using Clock = std::function<std::int64_t()>;

    //==========================================================================================================
    // Options
    // Fields:
    //   failureThreshold: Countable consecutive failures that open the circuit (>= 1).
    //   resetTimeout: Time spent OPEN before a probe is allowed.
    //   failureDecay: Time after the first failure of a burst after which the count is forgotten.
    //   policy: Which failures count toward the threshold.
    //   predicate: Used when policy == Custom; a Custom policy without predicate counts everything.
    //   clock: Time source; defaults to std::chrono::steady_clock.
    //==========================================================================================================
    struct Options {
        int failureThreshold{defaults::CB_FAILURE_THRESHOLD};
        std::chrono::milliseconds resetTimeout{defaults::CB_RESET_TIMEOUT_MS};
        std::chrono::milliseconds failureDecay{defaults::CB_FAILURE_DECAY_MS};
        FailurePolicy policy{FailurePolicy::AllExceptions};
        FailurePredicate predicate;
        Clock clock;
    };

    //==========================================================================================================
    // Metrics
    // Purpose: Point-in-time snapshot of counters and state.
    //==========================================================================================================
    struct Metrics {
        State state{State::Closed};
        int failureCount{0};
        int failureThreshold{0};
        bool probeInFlight{false};
        std::uint64_t totalRequests{0};
        std::uint64_t successfulRequests{0};
        std::uint64_t failedRequests{0};
        std::uint64_t rejectedRequests{0};
        std::uint64_t circuitTrips{0};
        std::map<int, std::uint64_t> statusCodes;
        std::optional<std::int64_t> millisSinceLastFailure;
    };

    //==========================================================================================================
    // Constructor
    // Args:
    //   delegate: Executor to protect (required).
    //   opts: Thresholds, policy and clock.
    // Throws:
    //   std::invalid_argument on a null delegate, threshold < 1 or negative durations.
    //==========================================================================================================
    CircuitBreakerExecutor(ExecutorPtr delegate, Options opts);
    explicit CircuitBreakerExecutor(ExecutorPtr delegate);
    ~CircuitBreakerExecutor() override;

    ////////////////////////////////////////// IExecutor //////////////////////////////////////////
    Response Execute(const RequestSpec& spec) override;

    /////////////////////////////////////////// Monitoring ///////////////////////////////////////////
    State GetState() const;
    int GetFailureCount() const;
    Metrics GetMetrics() const;

    //==========================================================================================================
    // PerformHealthCheck
    // Purpose: Calls the delegate directly, bypassing phase gating. Success closes the circuit from any
    //          phase; a TransportError while HALF_OPEN sends it back to OPEN.
    // Returns:
    //   true when the delegate answered successfully.
    //==========================================================================================================
    bool PerformHealthCheck(const RequestSpec& spec);

    // Forces CLOSED with a zero failure count and no probe in flight.
    void Reset();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

const char* ToString(CircuitBreakerExecutor::State state);
const char* ToString(CircuitBreakerExecutor::FailurePolicy policy);
std::optional<CircuitBreakerExecutor::FailurePolicy> FailurePolicyFromString(const std::string& name);

} // namespace rr
