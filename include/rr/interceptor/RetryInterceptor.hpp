//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/interceptor/RetryInterceptor.hpp
// Purpose: Exponential backoff retry policy plugged into the interceptor pipeline
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <utility>

#include "rr/HttpConstants.h"
#include "rr/interceptor/RequestInterceptor.hpp"

namespace rr {

//==========================================================================================================
// RetryInterceptor
// Purpose: Retries failures accepted by the retry predicate, sleeping on the calling thread for
//          min(initialDelay * backoffMultiplier^attempt, maxDelay) before each retry.
// Notes:
//   - The default predicate retries network failures (no status) and 5xx responses only.
//     Circuit-open, configuration and authorization failures are never retried.
//   - POST and PATCH are retried only when retryNonIdempotent is set.
//   - A retry whose delay would run past the request deadline is not attempted.
//==========================================================================================================
class RetryInterceptor : public RequestInterceptor {
public:
    using RetryPredicate = std::function<bool(const errors::TransportError&)>;

    struct Options {
        int maxRetries{defaults::RETRY_MAX_RETRIES};
        std::chrono::milliseconds initialDelay{defaults::RETRY_INITIAL_DELAY_MS};
        double backoffMultiplier{defaults::RETRY_BACKOFF_MULTIPLIER};
        std::chrono::milliseconds maxDelay{defaults::RETRY_MAX_DELAY_MS};
        bool retryNonIdempotent{false};
        RetryPredicate predicate;
    };

    RetryInterceptor();

    //==========================================================================================================
    // Constructor
    // Throws:
    //   std::invalid_argument when maxRetries or initialDelay is negative, or backoffMultiplier < 1.0.
    //==========================================================================================================
    explicit RetryInterceptor(Options opts);

    Response OnError(const errors::TransportError& error, const RequestSpec& spec, InterceptorChain& chain) override;
    int GetOrder() const override { return defaults::RETRY_INTERCEPTOR_ORDER; }

    // Delay before retry number retryCount (0-based).
    std::chrono::milliseconds CalculateDelay(int retryCount) const;

    const Options& GetOptions() const { return opts; }

    static bool DefaultRetryPredicate(const errors::TransportError& error);

    class Builder {
    public:
        Builder& MaxRetries(int value) { opts.maxRetries = value; return *this; }
        Builder& InitialDelay(std::chrono::milliseconds value) { opts.initialDelay = value; return *this; }
        Builder& BackoffMultiplier(double value) { opts.backoffMultiplier = value; return *this; }
        Builder& MaxDelay(std::chrono::milliseconds value) { opts.maxDelay = value; return *this; }
        Builder& RetryNonIdempotent(bool value) { opts.retryNonIdempotent = value; return *this; }
        Builder& RetryOn(RetryPredicate value) { opts.predicate = std::move(value); return *this; }
        RetryInterceptor Build() const { return RetryInterceptor(opts); }

    private:
        Options opts;
    };

private:
    Options opts;
};

} // namespace rr
