//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/FluentExecutor.cpp
// Purpose: Failure classification and the Result/exception bridge
//==========================================================================================================

#include "rr/FluentExecutor.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

#include "logging/Logger.h"
#include "rr/UrlUtils.h"

namespace rr {

class FluentExecutor::Impl {
public:
    ExecutorPtr delegate;
    mutable std::mutex baseUrlMutex;
    std::string baseUrl;

    Impl(ExecutorPtr d, std::string url) : delegate(std::move(d)), baseUrl(std::move(url)) {}

    std::string currentBaseUrl() const {
        std::lock_guard<std::mutex> lk(baseUrlMutex);
        return baseUrl;
    }
};

FluentExecutor::FluentExecutor(ExecutorPtr delegate, std::string baseUrl) {
    if (!delegate) {
        throw std::invalid_argument("delegate must not be null");
    }
    pImpl = std::make_unique<Impl>(std::move(delegate), std::move(baseUrl));
}

FluentExecutor::~FluentExecutor() = default;

ApiResult FluentExecutor::ExecuteWithResult(const RequestSpec& spec) {
    FUNC_SCOPE();
    const std::string baseUrl = pImpl->currentBaseUrl();
    if (url::ConflictsWithBaseUrl(spec.GetEndpoint(), baseUrl)) {
        const std::string msg = url::ConflictMessage(spec.GetEndpoint(), baseUrl);
        LOG_WARN("{}", msg);
        return ApiResult::Failure(ApiError::Config(msg));
    }

    try {
        return ApiResult::Success(pImpl->delegate->Execute(spec));
    } catch (const errors::TransportError& e) {
        return ApiResult::Failure(Classify(e));
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected failure executing {}: {}", spec.Describe(), e.what());
        return ApiResult::Failure(ApiError::Network(std::string("Unexpected error: ") + e.what()));
    }
}

Response FluentExecutor::Execute(const RequestSpec& spec) {
    ApiResult result = ExecuteWithResult(spec);
    if (result.IsFailure()) {
        throw ToTransportError(result.Error());
    }
    return result.Value();
}

void FluentExecutor::SetBaseUrl(const std::string& baseUrl) {
    std::lock_guard<std::mutex> lk(pImpl->baseUrlMutex);
    pImpl->baseUrl = baseUrl;
}

std::string FluentExecutor::GetBaseUrl() const {
    return pImpl->currentBaseUrl();
}

ApiError FluentExecutor::Classify(const errors::TransportError& error) {
    const int status = error.StatusCode();
    const std::string message = error.what();
    const auto& body = error.ResponseBody();

    if (error.Kind() == FailureKind::CircuitOpen) {
        return ApiError::CircuitOpen(message, status, body);
    }
    if (status == http_status::UNAUTHORIZED || error.Kind() == FailureKind::Unauthorized) {
        return ApiError::Auth(status, message, body);
    }
    if (http_status::IsClientError(status) || http_status::IsServerError(status)) {
        return ApiError::Http(status, message, body);
    }
    if (error.Kind() == FailureKind::Network) {
        return ApiError::Network(message, status, body);
    }
    if (error.Kind() == FailureKind::Config) {
        return ApiError::Config(message, status, body);
    }
    return ApiError::Http(status, message, body);
}

errors::TransportError FluentExecutor::ToTransportError(const ApiError& error) {
    FailureKind kind = FailureKind::HttpError;
    switch (error.type) {
        case ErrorType::HttpError: kind = FailureKind::HttpError; break;
        case ErrorType::AuthError: kind = FailureKind::Unauthorized; break;
        case ErrorType::NetworkError: kind = FailureKind::Network; break;
        case ErrorType::CircuitOpen: kind = FailureKind::CircuitOpen; break;
        case ErrorType::ConfigError: kind = FailureKind::Config; break;
    }
    return errors::TransportError(error.message, error.statusCode, error.responseBody, kind);
}

} // namespace rr
