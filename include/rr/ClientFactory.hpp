//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/ClientFactory.hpp
// Purpose: Builder composing the executor decorator chain
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rr/AsyncExecutor.hpp"
#include "rr/CircuitBreakerExecutor.hpp"
#include "rr/ClientOptions.hpp"
#include "rr/Executor.h"
#include "rr/FluentExecutor.hpp"
#include "rr/interceptor/InterceptingExecutor.hpp"
#include "rr/interceptor/RetryInterceptor.hpp"

namespace rr {

//==========================================================================================================
// ClientBuilder
// Purpose: Wraps a base executor in the configured decorators. Innermost first:
//          base -> custom decorators (registration order) -> InterceptingExecutor (when any interceptor
//          is registered) -> CircuitBreakerExecutor (when enabled here or by options).
// Notes:
//   - Without WithTransport() the base executor is an HttpExecutor built from the options.
//   - Circuit breaker settings given to the builder take precedence over ClientOptions.
//==========================================================================================================
class ClientBuilder {
public:
    explicit ClientBuilder(std::string baseUrl = std::string());

    ClientBuilder& WithOptions(ClientOptions options);

    // Replaces the default HttpExecutor.
    ClientBuilder& WithTransport(ExecutorPtr transport);

    ClientBuilder& WithCircuitBreaker();
    ClientBuilder& WithCircuitBreaker(int failureThreshold, std::chrono::milliseconds resetTimeout);
    ClientBuilder& WithCircuitBreaker(int failureThreshold,
                                      std::chrono::milliseconds resetTimeout,
                                      std::chrono::milliseconds failureDecay,
                                      CircuitBreakerExecutor::FailurePolicy policy);

    // Enables the breaker with FailurePolicy::Custom and this predicate.
    ClientBuilder& WithFailurePredicate(CircuitBreakerExecutor::FailurePredicate predicate);

    // Time source for the breaker.
    ClientBuilder& WithClock(CircuitBreakerExecutor::Clock clock);

    // Adds a RetryInterceptor with these options.
    ClientBuilder& WithRetry(RetryInterceptor::Options options);
    ClientBuilder& WithRetry(int maxRetries, std::chrono::milliseconds initialDelay, double backoffMultiplier);

    ClientBuilder& WithInterceptor(InterceptorPtr interceptor);

    // Global ceiling on chain retries per logical request.
    ClientBuilder& WithMaxRetries(int maxRetries);

    ClientBuilder& WithCustomDecorator(ExecutorDecorator decorator);

    //==========================================================================================================
    // Build
    // Returns:
    //   The fully composed executor.
    // Throws:
    //   std::invalid_argument when a decorator returns null or a decorator rejects its settings.
    //==========================================================================================================
    ExecutorPtr Build() const;

    std::shared_ptr<FluentExecutor> BuildFluent() const;

    // poolSize 0 uses options.asyncPoolSize.
    std::shared_ptr<AsyncExecutor> BuildAsync(std::size_t poolSize = 0) const;

private:
    std::string baseUrl;
    ClientOptions options;
    ExecutorPtr transport;
    std::optional<CircuitBreakerExecutor::Options> breaker;
    CircuitBreakerExecutor::FailurePredicate failurePredicate;
    CircuitBreakerExecutor::Clock clock;
    std::vector<InterceptorPtr> interceptors;
    int maxRetries{defaults::CHAIN_MAX_RETRIES};
    std::vector<ExecutorDecorator> decorators;
};

} // namespace rr
