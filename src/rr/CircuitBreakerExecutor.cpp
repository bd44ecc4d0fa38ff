//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/CircuitBreakerExecutor.cpp
// Purpose: Lock-free circuit breaker state machine around a delegate executor
//==========================================================================================================

#include "rr/CircuitBreakerExecutor.hpp"

#include <atomic>
#include <cctype>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "logging/Logger.h"

namespace rr {

namespace {

// State word layout: bits 0-1 phase, bit 2 probe-in-flight, bits 32-63 consecutive failures.
constexpr std::uint64_t PHASE_MASK = 0x3u;
constexpr std::uint64_t PROBE_BIT = 0x4u;
constexpr int FAILURE_SHIFT = 32;

using State = CircuitBreakerExecutor::State;

inline std::uint64_t packWord(State phase, bool probe, std::uint32_t failures) {
    return static_cast<std::uint64_t>(phase) | (probe ? PROBE_BIT : 0u) |
           (static_cast<std::uint64_t>(failures) << FAILURE_SHIFT);
}

inline State phaseOf(std::uint64_t w) { return static_cast<State>(w & PHASE_MASK); }
inline bool probeOf(std::uint64_t w) { return (w & PROBE_BIT) != 0; }
inline std::uint32_t failuresOf(std::uint64_t w) { return static_cast<std::uint32_t>(w >> FAILURE_SHIFT); }

std::int64_t steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch()).count();
}

constexpr std::int64_t NO_FAILURE = -1;

} // namespace

class CircuitBreakerExecutor::Impl {
public:
    ExecutorPtr delegate;
    int failureThreshold;
    std::int64_t resetTimeoutMs;
    std::int64_t failureDecayMs;
    FailurePolicy policy;
    FailurePredicate countable;
    Clock clock;

    std::atomic<std::uint64_t> word{packWord(State::Closed, false, 0)};
    std::atomic<std::int64_t> lastFailureMs{NO_FAILURE};
    std::atomic<std::int64_t> lastDecayMs{0};

    std::atomic<std::uint64_t> totalRequests{0};
    std::atomic<std::uint64_t> successfulRequests{0};
    std::atomic<std::uint64_t> failedRequests{0};
    std::atomic<std::uint64_t> rejectedRequests{0};
    std::atomic<std::uint64_t> circuitTrips{0};

    // Histogram only; never held across a delegate call.
    mutable std::mutex statusMutex;
    std::map<int, std::uint64_t> statusCodes;

    Impl(ExecutorPtr d, Options opts)
        : delegate(std::move(d)),
          failureThreshold(opts.failureThreshold),
          resetTimeoutMs(opts.resetTimeout.count()),
          failureDecayMs(opts.failureDecay.count()),
          policy(opts.policy),
          clock(opts.clock ? std::move(opts.clock) : Clock(&steadyNowMs)) {
        if (!delegate) {
            throw std::invalid_argument("delegate must not be null");
        }
        if (failureThreshold < 1) {
            throw std::invalid_argument("failureThreshold must be at least 1");
        }
        if (resetTimeoutMs < 0) {
            throw std::invalid_argument("resetTimeout must not be negative");
        }
        if (failureDecayMs < 0) {
            throw std::invalid_argument("failureDecay must not be negative");
        }
        countable = makePredicate(policy, std::move(opts.predicate));
        lastDecayMs.store(clock());
    }

    static FailurePredicate makePredicate(FailurePolicy p, FailurePredicate custom) {
        switch (p) {
            case FailurePolicy::ServerErrorsOnly:
                return [](const errors::TransportError& e) { return http_status::IsServerError(e.StatusCode()); };
            case FailurePolicy::ExcludeClientErrors:
                return [](const errors::TransportError& e) { return !http_status::IsClientError(e.StatusCode()); };
            case FailurePolicy::Custom:
                if (custom) {
                    return custom;
                }
                return [](const errors::TransportError&) { return true; };
            case FailurePolicy::AllExceptions:
                break;
        }
        return [](const errors::TransportError&) { return true; };
    }

    [[noreturn]] void reject(std::int64_t now) {
        rejectedRequests.fetch_add(1, std::memory_order_relaxed);
        const std::int64_t last = lastFailureMs.load(std::memory_order_acquire);
        const std::int64_t since = last == NO_FAILURE ? 0 : now - last;
        throw errors::CircuitBreakerOpenException(messages::CIRCUIT_OPEN, since, resetTimeoutMs);
    }

    void recordStatus(int status) {
        if (status <= 0) {
            return;
        }
        std::lock_guard<std::mutex> lk(statusMutex);
        statusCodes[status] += 1;
    }

    //==========================================================================================================
    // Forgets the failure count when the decay window has elapsed while CLOSED.
    //==========================================================================================================
    void applyDecay(std::int64_t now) {
        std::uint64_t w = word.load(std::memory_order_acquire);
        while (phaseOf(w) == State::Closed && failuresOf(w) > 0 &&
               now - lastDecayMs.load(std::memory_order_acquire) >= failureDecayMs) {
            if (word.compare_exchange_weak(w, packWord(State::Closed, false, 0), std::memory_order_acq_rel)) {
                lastDecayMs.store(now, std::memory_order_release);
                LOG_DEBUG(messages::CIRCUIT_DECAY);
                return;
            }
        }
    }

    //==========================================================================================================
    // Admits the call or throws CircuitBreakerOpenException.
    // Returns:
    //   true when the caller won the probe slot in HALF_OPEN.
    //==========================================================================================================
    bool admit(std::int64_t now) {
        std::uint64_t w = word.load(std::memory_order_acquire);
        for (;;) {
            switch (phaseOf(w)) {
                case State::Closed:
                    return false;
                case State::Open: {
                    const std::int64_t since = now - lastFailureMs.load(std::memory_order_acquire);
                    if (since < resetTimeoutMs) {
                        reject(now);
                    }
                    if (word.compare_exchange_weak(w, packWord(State::HalfOpen, true, failuresOf(w)),
                                                   std::memory_order_acq_rel)) {
                        LOG_INFO(messages::CIRCUIT_HALF_OPEN);
                        return true;
                    }
                    break;
                }
                case State::HalfOpen:
                    if (probeOf(w)) {
                        LOG_DEBUG(messages::CIRCUIT_PROBE_IN_PROGRESS);
                        reject(now);
                    }
                    if (word.compare_exchange_weak(w, packWord(State::HalfOpen, true, failuresOf(w)),
                                                   std::memory_order_acq_rel)) {
                        return true;
                    }
                    break;
            }
        }
    }

    //==========================================================================================================
    // Records a countable failure observed while CLOSED.
    // Returns:
    //   true only for the caller whose compare-and-swap moved the circuit to OPEN.
    //==========================================================================================================
    bool recordClosedFailure(std::int64_t now) {
        std::uint64_t w = word.load(std::memory_order_acquire);
        while (phaseOf(w) == State::Closed) {
            const std::uint32_t failures = failuresOf(w) + 1;
            if (static_cast<int>(failures) >= failureThreshold) {
                lastFailureMs.store(now, std::memory_order_release);
                if (word.compare_exchange_weak(w, packWord(State::Open, false, failures), std::memory_order_acq_rel)) {
                    circuitTrips.fetch_add(1, std::memory_order_relaxed);
                    LOG_WARN("Circuit breaker opened after {} failures", failures);
                    return true;
                }
            } else {
                if (failures == 1) {
                    lastDecayMs.store(now, std::memory_order_release);
                }
                if (word.compare_exchange_weak(w, packWord(State::Closed, false, failures), std::memory_order_acq_rel)) {
                    return false;
                }
            }
        }
        return false;
    }

    void probeSucceeded(std::int64_t now) {
        std::uint64_t w = word.load(std::memory_order_acquire);
        while (phaseOf(w) == State::HalfOpen && probeOf(w)) {
            if (word.compare_exchange_weak(w, packWord(State::Closed, false, 0), std::memory_order_acq_rel)) {
                lastDecayMs.store(now, std::memory_order_release);
                LOG_INFO(messages::CIRCUIT_CLOSED);
                return;
            }
        }
    }

    void probeFailed(std::int64_t now) {
        std::uint64_t w = word.load(std::memory_order_acquire);
        while (phaseOf(w) == State::HalfOpen) {
            lastFailureMs.store(now, std::memory_order_release);
            if (word.compare_exchange_weak(w, packWord(State::Open, false, failuresOf(w)), std::memory_order_acq_rel)) {
                LOG_WARN(messages::CIRCUIT_PROBE_FAILED);
                return;
            }
        }
    }

    void releaseProbe() {
        std::uint64_t w = word.load(std::memory_order_acquire);
        while (phaseOf(w) == State::HalfOpen && probeOf(w)) {
            if (word.compare_exchange_weak(w, w & ~PROBE_BIT, std::memory_order_acq_rel)) {
                return;
            }
        }
    }

    // Moves to the target phase unconditionally, clearing the probe flag.
    void forcePhase(State target, std::uint32_t failures) {
        std::uint64_t w = word.load(std::memory_order_acquire);
        while (!word.compare_exchange_weak(w, packWord(target, false, failures), std::memory_order_acq_rel)) {
        }
    }

    // Clears the probe flag on every exit path unless the outcome already moved the phase.
    class ProbeGuard {
    public:
        ProbeGuard(Impl* impl, bool active) : impl(impl), active(active) {}
        ~ProbeGuard() {
            if (active) {
                impl->releaseProbe();
            }
        }
        void Dismiss() { active = false; }
        ProbeGuard(const ProbeGuard&) = delete;
        ProbeGuard& operator=(const ProbeGuard&) = delete;

    private:
        Impl* impl;
        bool active;
    };
};

CircuitBreakerExecutor::CircuitBreakerExecutor(ExecutorPtr delegate, Options opts)
    : pImpl(std::make_unique<Impl>(std::move(delegate), std::move(opts))) {}

CircuitBreakerExecutor::CircuitBreakerExecutor(ExecutorPtr delegate)
    : CircuitBreakerExecutor(std::move(delegate), Options{}) {}

CircuitBreakerExecutor::~CircuitBreakerExecutor() = default;

Response CircuitBreakerExecutor::Execute(const RequestSpec& spec) {
    FUNC_SCOPE();
    const std::int64_t start = pImpl->clock();
    pImpl->applyDecay(start);
    pImpl->totalRequests.fetch_add(1, std::memory_order_relaxed);

    const bool isProbe = pImpl->admit(start);
    Impl::ProbeGuard guard(pImpl.get(), isProbe);

    try {
        Response response = pImpl->delegate->Execute(spec);
        pImpl->recordStatus(response.status);
        if (isProbe) {
            pImpl->probeSucceeded(pImpl->clock());
            guard.Dismiss();
        }
        pImpl->successfulRequests.fetch_add(1, std::memory_order_relaxed);
        return response;
    } catch (const errors::TransportError& e) {
        // Caller misuse says nothing about the backend's health.
        if (e.Kind() == FailureKind::Config) {
            throw;
        }
        pImpl->failedRequests.fetch_add(1, std::memory_order_relaxed);
        pImpl->recordStatus(e.StatusCode());

        if (!pImpl->countable(e)) {
            throw;
        }
        const std::int64_t now = pImpl->clock();
        if (isProbe) {
            pImpl->probeFailed(now);
            guard.Dismiss();
            throw;
        }
        if (pImpl->recordClosedFailure(now)) {
            throw errors::CircuitBreakerOpenException(
                std::string(messages::CIRCUIT_OPENED_BY_FAILURE) + e.what(),
                0, pImpl->resetTimeoutMs, true, std::current_exception());
        }
        throw;
    }
}

CircuitBreakerExecutor::State CircuitBreakerExecutor::GetState() const {
    return phaseOf(pImpl->word.load(std::memory_order_acquire));
}

int CircuitBreakerExecutor::GetFailureCount() const {
    return static_cast<int>(failuresOf(pImpl->word.load(std::memory_order_acquire)));
}

CircuitBreakerExecutor::Metrics CircuitBreakerExecutor::GetMetrics() const {
    Metrics m;
    const std::uint64_t w = pImpl->word.load(std::memory_order_acquire);
    m.state = phaseOf(w);
    m.failureCount = static_cast<int>(failuresOf(w));
    m.failureThreshold = pImpl->failureThreshold;
    m.probeInFlight = probeOf(w);
    m.totalRequests = pImpl->totalRequests.load(std::memory_order_relaxed);
    m.successfulRequests = pImpl->successfulRequests.load(std::memory_order_relaxed);
    m.failedRequests = pImpl->failedRequests.load(std::memory_order_relaxed);
    m.rejectedRequests = pImpl->rejectedRequests.load(std::memory_order_relaxed);
    m.circuitTrips = pImpl->circuitTrips.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lk(pImpl->statusMutex);
        m.statusCodes = pImpl->statusCodes;
    }
    const std::int64_t last = pImpl->lastFailureMs.load(std::memory_order_acquire);
    if (last != NO_FAILURE) {
        m.millisSinceLastFailure = pImpl->clock() - last;
    }
    return m;
}

bool CircuitBreakerExecutor::PerformHealthCheck(const RequestSpec& spec) {
    FUNC_SCOPE();
    try {
        pImpl->delegate->Execute(spec);
    } catch (const errors::TransportError& e) {
        LOG_DEBUG("Health check failed: {}", e.what());
        const std::int64_t now = pImpl->clock();
        std::uint64_t w = pImpl->word.load(std::memory_order_acquire);
        while (phaseOf(w) == State::HalfOpen) {
            pImpl->lastFailureMs.store(now, std::memory_order_release);
            if (pImpl->word.compare_exchange_weak(w, packWord(State::Open, false, failuresOf(w)),
                                                  std::memory_order_acq_rel)) {
                LOG_WARN(messages::CIRCUIT_PROBE_FAILED);
                break;
            }
        }
        return false;
    }

    if (GetState() != State::Closed) {
        pImpl->forcePhase(State::Closed, 0);
        pImpl->lastDecayMs.store(pImpl->clock(), std::memory_order_release);
        LOG_INFO(messages::CIRCUIT_CLOSED);
    }
    return true;
}

void CircuitBreakerExecutor::Reset() {
    pImpl->forcePhase(State::Closed, 0);
    pImpl->lastDecayMs.store(pImpl->clock(), std::memory_order_release);
    LOG_INFO("{} (manual reset)", messages::CIRCUIT_CLOSED);
}

const char* ToString(CircuitBreakerExecutor::State state) {
    switch (state) {
        case CircuitBreakerExecutor::State::Closed: return "CLOSED";
        case CircuitBreakerExecutor::State::Open: return "OPEN";
        case CircuitBreakerExecutor::State::HalfOpen: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

const char* ToString(CircuitBreakerExecutor::FailurePolicy policy) {
    switch (policy) {
        case CircuitBreakerExecutor::FailurePolicy::AllExceptions: return "ALL_EXCEPTIONS";
        case CircuitBreakerExecutor::FailurePolicy::ServerErrorsOnly: return "SERVER_ERRORS_ONLY";
        case CircuitBreakerExecutor::FailurePolicy::ExcludeClientErrors: return "EXCLUDE_CLIENT_ERRORS";
        case CircuitBreakerExecutor::FailurePolicy::Custom: return "CUSTOM";
    }
    return "ALL_EXCEPTIONS";
}

std::optional<CircuitBreakerExecutor::FailurePolicy> FailurePolicyFromString(const std::string& name) {
    std::string s; s.reserve(name.size());
    for (char c : name) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "ALL_EXCEPTIONS") return CircuitBreakerExecutor::FailurePolicy::AllExceptions;
    if (s == "SERVER_ERRORS_ONLY") return CircuitBreakerExecutor::FailurePolicy::ServerErrorsOnly;
    if (s == "EXCLUDE_CLIENT_ERRORS") return CircuitBreakerExecutor::FailurePolicy::ExcludeClientErrors;
    if (s == "CUSTOM") return CircuitBreakerExecutor::FailurePolicy::Custom;
    return std::nullopt;
}

} // namespace rr
