//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/ClientFactory.cpp
// Purpose: Builder composing the executor decorator chain
//==========================================================================================================

#include "rr/ClientFactory.hpp"

#include <stdexcept>
#include <utility>

#include "logging/Logger.h"
#include "rr/HttpExecutor.hpp"

namespace rr {

ClientBuilder::ClientBuilder(std::string baseUrl) : baseUrl(std::move(baseUrl)) {}

ClientBuilder& ClientBuilder::WithOptions(ClientOptions opts) {
    options = std::move(opts);
    return *this;
}

ClientBuilder& ClientBuilder::WithTransport(ExecutorPtr t) {
    transport = std::move(t);
    return *this;
}

ClientBuilder& ClientBuilder::WithCircuitBreaker() {
    if (!breaker) {
        breaker = CircuitBreakerExecutor::Options{};
    }
    return *this;
}

ClientBuilder& ClientBuilder::WithCircuitBreaker(int failureThreshold, std::chrono::milliseconds resetTimeout) {
    WithCircuitBreaker();
    breaker->failureThreshold = failureThreshold;
    breaker->resetTimeout = resetTimeout;
    return *this;
}

ClientBuilder& ClientBuilder::WithCircuitBreaker(int failureThreshold,
                                                 std::chrono::milliseconds resetTimeout,
                                                 std::chrono::milliseconds failureDecay,
                                                 CircuitBreakerExecutor::FailurePolicy policy) {
    WithCircuitBreaker(failureThreshold, resetTimeout);
    breaker->failureDecay = failureDecay;
    breaker->policy = policy;
    return *this;
}

ClientBuilder& ClientBuilder::WithFailurePredicate(CircuitBreakerExecutor::FailurePredicate predicate) {
    failurePredicate = std::move(predicate);
    return *this;
}

ClientBuilder& ClientBuilder::WithClock(CircuitBreakerExecutor::Clock c) {
    clock = std::move(c);
    return *this;
}

ClientBuilder& ClientBuilder::WithRetry(RetryInterceptor::Options opts) {
    interceptors.push_back(std::make_shared<RetryInterceptor>(std::move(opts)));
    return *this;
}

ClientBuilder& ClientBuilder::WithRetry(int retries, std::chrono::milliseconds initialDelay, double backoffMultiplier) {
    RetryInterceptor::Options opts;
    opts.maxRetries = retries;
    opts.initialDelay = initialDelay;
    opts.backoffMultiplier = backoffMultiplier;
    return WithRetry(std::move(opts));
}

ClientBuilder& ClientBuilder::WithInterceptor(InterceptorPtr interceptor) {
    if (!interceptor) {
        throw std::invalid_argument("Interceptor cannot be null");
    }
    interceptors.push_back(std::move(interceptor));
    return *this;
}

ClientBuilder& ClientBuilder::WithMaxRetries(int value) {
    maxRetries = value;
    return *this;
}

ClientBuilder& ClientBuilder::WithCustomDecorator(ExecutorDecorator decorator) {
    if (!decorator) {
        throw std::invalid_argument("Decorator cannot be null");
    }
    decorators.push_back(std::move(decorator));
    return *this;
}

ExecutorPtr ClientBuilder::Build() const {
    FUNC_SCOPE();
    ExecutorPtr exec = transport ? transport : std::make_shared<HttpExecutor>(baseUrl, options);

    for (const auto& decorate : decorators) {
        exec = decorate(exec);
        if (!exec) {
            throw std::invalid_argument("Custom decorator returned a null executor");
        }
    }

    if (!interceptors.empty()) {
        exec = std::make_shared<InterceptingExecutor>(exec, interceptors, maxRetries);
        LOG_DEBUG("Added interceptor chain with {} interceptor(s)", interceptors.size());
    }

    if (breaker || failurePredicate || options.circuitBreakerEnabled) {
        CircuitBreakerExecutor::Options cb = breaker ? *breaker : options.BreakerOptions();
        if (failurePredicate) {
            cb.policy = CircuitBreakerExecutor::FailurePolicy::Custom;
            cb.predicate = failurePredicate;
        }
        if (clock) {
            cb.clock = clock;
        }
        exec = std::make_shared<CircuitBreakerExecutor>(exec, std::move(cb));
        LOG_DEBUG("Added circuit breaker");
    }
    return exec;
}

std::shared_ptr<FluentExecutor> ClientBuilder::BuildFluent() const {
    return std::make_shared<FluentExecutor>(Build(), baseUrl);
}

std::shared_ptr<AsyncExecutor> ClientBuilder::BuildAsync(std::size_t poolSize) const {
    return std::make_shared<AsyncExecutor>(Build(), poolSize == 0 ? options.asyncPoolSize : poolSize);
}

} // namespace rr
