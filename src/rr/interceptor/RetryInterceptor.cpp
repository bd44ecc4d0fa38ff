//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/interceptor/RetryInterceptor.cpp
// Purpose: Backoff computation and retry decision
//==========================================================================================================

#include "rr/interceptor/RetryInterceptor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <utility>

#include "logging/Logger.h"

namespace rr {

RetryInterceptor::RetryInterceptor() : RetryInterceptor(Options{}) {}

RetryInterceptor::RetryInterceptor(Options o) : opts(std::move(o)) {
    if (opts.maxRetries < 0) {
        throw std::invalid_argument("maxRetries must be non-negative");
    }
    if (opts.initialDelay.count() < 0) {
        throw std::invalid_argument("initialDelay must be non-negative");
    }
    if (opts.backoffMultiplier < 1.0) {
        throw std::invalid_argument("backoffMultiplier must be >= 1.0");
    }
    if (!opts.predicate) {
        opts.predicate = &RetryInterceptor::DefaultRetryPredicate;
    }
}

bool RetryInterceptor::DefaultRetryPredicate(const errors::TransportError& error) {
    switch (error.Kind()) {
        case FailureKind::CircuitOpen:
        case FailureKind::Config:
        case FailureKind::Unauthorized:
            return false;
        case FailureKind::Network:
            return true;
        case FailureKind::HttpError:
            break;
    }
    const int status = error.StatusCode();
    if (status <= 0) {
        return true;
    }
    return http_status::IsServerError(status);
}

std::chrono::milliseconds RetryInterceptor::CalculateDelay(int retryCount) const {
    const double delay = static_cast<double>(opts.initialDelay.count()) * std::pow(opts.backoffMultiplier, retryCount);
    const double cap = static_cast<double>(opts.maxDelay.count());
    return std::chrono::milliseconds(static_cast<long long>(std::min(delay, cap)));
}

Response RetryInterceptor::OnError(const errors::TransportError& error, const RequestSpec& spec, InterceptorChain& chain) {
    const int currentRetry = chain.GetRetryCount();

    if (currentRetry >= opts.maxRetries) {
        LOG_DEBUG("Max retries ({}) exceeded for {}", opts.maxRetries, spec.Describe());
        error.Raise();
    }
    if (!IsIdempotent(spec.GetMethod()) && !opts.retryNonIdempotent) {
        LOG_DEBUG("Not retrying non-idempotent request {}", spec.Describe());
        error.Raise();
    }
    if (!opts.predicate(error)) {
        LOG_DEBUG("Failure not retryable: {} (status {})", errors::ToString(error.Kind()), error.StatusCode());
        error.Raise();
    }

    const auto delay = CalculateDelay(currentRetry);
    const auto& deadline = spec.GetDeadline();
    if (deadline && std::chrono::steady_clock::now() + delay >= *deadline) {
        LOG_DEBUG("Retry of {} skipped: deadline would be exceeded", spec.Describe());
        error.Raise();
    }

    LOG_INFO("Retrying request {} (attempt {}/{}) after {}ms due to: {}",
             spec.Describe(), currentRetry + 1, opts.maxRetries, delay.count(), error.what());

    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    return chain.Retry(spec);
}

} // namespace rr
