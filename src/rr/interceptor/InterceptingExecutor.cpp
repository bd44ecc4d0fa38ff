//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/interceptor/InterceptingExecutor.cpp
// Purpose: Ordered interceptor pipeline with a bounded retry chain
//==========================================================================================================

#include "rr/interceptor/InterceptingExecutor.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "logging/Logger.h"

namespace rr {

class InterceptingExecutor::Impl {
public:
    ExecutorPtr delegate;
    std::vector<InterceptorPtr> interceptors;
    int maxRetries;

    Impl(ExecutorPtr d, std::vector<InterceptorPtr> list, int max)
        : delegate(std::move(d)), interceptors(std::move(list)), maxRetries(max) {
        if (!delegate) {
            throw std::invalid_argument("delegate must not be null");
        }
        if (maxRetries < 0) {
            throw std::invalid_argument("maxRetries must not be negative");
        }
        for (const auto& i : interceptors) {
            if (!i) {
                throw std::invalid_argument("interceptor must not be null");
            }
        }
        std::stable_sort(interceptors.begin(), interceptors.end(),
                         [](const InterceptorPtr& a, const InterceptorPtr& b) { return a->GetOrder() < b->GetOrder(); });
    }

    // Retry context bound to one attempt of one logical call.
    class Chain : public InterceptorChain {
    public:
        Chain(Impl& owner, int retryCount) : owner(owner), retryCount(retryCount) {}

        Response Retry(const RequestSpec& spec) override {
            if (retryCount >= owner.maxRetries) {
                throw errors::TransportError(std::string(messages::MAX_RETRY_EXCEEDED_PREFIX) +
                                             std::to_string(owner.maxRetries));
            }
            LOG_DEBUG("Retrying request (attempt {}): {}", retryCount + 1, spec.Describe());
            return owner.executeAttempt(spec, retryCount + 1);
        }

        int GetRetryCount() const override { return retryCount; }
        int GetMaxRetries() const override { return owner.maxRetries; }

    private:
        Impl& owner;
        int retryCount;
    };

    Response applyAfterResponse(Response response, const RequestSpec& spec) {
        for (auto it = interceptors.rbegin(); it != interceptors.rend(); ++it) {
            response = (*it)->AfterResponse(std::move(response), spec);
        }
        return response;
    }

    Response executeAttempt(const RequestSpec& spec, int retryCount) {
        Chain chain(*this, retryCount);

        RequestSpec current = spec;
        for (const auto& interceptor : interceptors) {
            current = interceptor->BeforeRequest(current);
        }

        std::exception_ptr failure;
        try {
            Response response = delegate->Execute(current);
            return applyAfterResponse(std::move(response), current);
        } catch (const errors::TransportError&) {
            failure = std::current_exception();
        }

        // First interceptor that returns wins; a rethrow replaces the failure seen by the next one.
        for (const auto& interceptor : interceptors) {
            try {
                try {
                    std::rethrow_exception(failure);
                } catch (const errors::TransportError& e) {
                    Response recovered = interceptor->OnError(e, current, chain);
                    return applyAfterResponse(std::move(recovered), current);
                }
            } catch (const errors::TransportError&) {
                failure = std::current_exception();
            }
        }
        std::rethrow_exception(failure);
    }
};

InterceptingExecutor::InterceptingExecutor(ExecutorPtr delegate,
                                           std::vector<InterceptorPtr> interceptors,
                                           int maxRetries)
    : pImpl(std::make_unique<Impl>(std::move(delegate), std::move(interceptors), maxRetries)) {}

InterceptingExecutor::~InterceptingExecutor() = default;

Response InterceptingExecutor::Execute(const RequestSpec& spec) {
    FUNC_SCOPE();
    return pImpl->executeAttempt(spec, 0);
}

const std::vector<InterceptorPtr>& InterceptingExecutor::GetInterceptors() const {
    return pImpl->interceptors;
}

int InterceptingExecutor::GetMaxRetries() const {
    return pImpl->maxRetries;
}

} // namespace rr
