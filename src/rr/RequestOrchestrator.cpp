//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/RequestOrchestrator.cpp
// Purpose: Default headers, authentication, timing and the token refresh loop
//==========================================================================================================

#include "rr/RequestOrchestrator.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

#include "logging/Logger.h"
#include "rr/HttpConstants.h"
#include "rr/UrlUtils.h"
#include "rr/auth/BasicAuth.hpp"

namespace rr {

class RequestOrchestrator::Impl {
public:
    ExecutorPtr delegate;
    ClientConfig config;

    Impl(ExecutorPtr d, ClientConfig c) : delegate(std::move(d)), config(std::move(c)) {
        if (!config.auth) {
            config.auth = std::make_shared<auth::NoAuth>();
        }
    }

    RequestSpec prepare(const RequestSpec& spec) const {
        Headers merged = config.defaultHeaders;
        merged.Merge(spec.GetHeaders());
        return spec.WithHeaders(config.auth->applyHeaders(std::move(merged)));
    }

    void refreshCredentials() {
        LOG_DEBUG("Refreshing authentication token");
        if (config.auth->refresh()) {
            LOG_DEBUG("Credentials refreshed successfully");
        } else {
            LOG_WARN("Credential refresh failed");
        }
    }

    void logRequest(const RequestSpec& spec) const {
        LOG_INFO("Executing {} request to: {}", ToString(spec.GetMethod()), spec.GetEndpoint());
        if (config.options.logRequestBody && spec.GetBody()) {
            LOG_DEBUG("Request body: {}", *spec.GetBody());
        }
    }
};

RequestOrchestrator::RequestOrchestrator(ExecutorPtr delegate, ClientConfig config) {
    if (!delegate) {
        throw std::invalid_argument("RequestOrchestrator requires a delegate executor");
    }
    pImpl = std::make_unique<Impl>(std::move(delegate), std::move(config));
}

RequestOrchestrator::~RequestOrchestrator() = default;

const ClientConfig& RequestOrchestrator::GetConfig() const {
    return pImpl->config;
}

Response RequestOrchestrator::Execute(const RequestSpec& spec) {
    FUNC_SCOPE();
    // Rejected before auth, logging or any decorator sees the request.
    if (url::ConflictsWithBaseUrl(spec.GetEndpoint(), pImpl->config.baseUrl)) {
        const std::string msg = url::ConflictMessage(spec.GetEndpoint(), pImpl->config.baseUrl);
        LOG_WARN("{}", msg);
        throw errors::ConfigException(msg);
    }

    const ClientOptions& opts = pImpl->config.options;
    if (!opts.timingEnabled || !opts.loggingEnabled) {
        return ExecuteWithRetry(spec, opts.maxRetries);
    }

    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    };
    try {
        Response resp = ExecuteWithRetry(spec, opts.maxRetries);
        LOG_INFO("Request completed in {}ms: {} {}", elapsed(), ToString(spec.GetMethod()), spec.GetEndpoint());
        return resp;
    } catch (const TransportError&) {
        LOG_INFO("Request failed after {}ms: {} {}", elapsed(), ToString(spec.GetMethod()), spec.GetEndpoint());
        throw;
    }
}

Response RequestOrchestrator::ExecuteWithRetry(const RequestSpec& spec, int retriesLeft) {
    const ClientOptions& opts = pImpl->config.options;

    if (pImpl->config.auth->needsRefresh()) {
        pImpl->refreshCredentials();
    }
    RequestSpec prepared = pImpl->prepare(spec);
    if (opts.loggingEnabled) {
        pImpl->logRequest(prepared);
    }

    try {
        return pImpl->delegate->Execute(prepared);
    } catch (const errors::CircuitBreakerOpenException& e) {
        LOG_WARN("Circuit breaker is open: {}", e.what());
        throw;
    } catch (const TransportError& e) {
        if (e.Kind() == FailureKind::CircuitOpen) {
            LOG_WARN("Circuit breaker is open: {}", e.what());
            throw;
        }
        if (e.Kind() != FailureKind::Unauthorized) {
            if (opts.loggingEnabled) {
                LOG_ERROR("HTTP client error: {}", e.what());
            }
            throw;
        }
        if (retriesLeft > 0 && opts.retryEnabled && !spec.HasDeadlinePassed()) {
            LOG_DEBUG("Token expired, attempting refresh. Retries left: {}", retriesLeft);
            pImpl->refreshCredentials();
            if (opts.retryDelayMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(opts.retryDelayMs));
            }
            return ExecuteWithRetry(spec, retriesLeft - 1);
        }
        LOG_ERROR("{}", messages::TOKEN_REFRESH_EXHAUSTED);
        throw errors::TokenRefreshExhaustedException(messages::TOKEN_REFRESH_EXHAUSTED, std::current_exception());
    }
}

} // namespace rr
