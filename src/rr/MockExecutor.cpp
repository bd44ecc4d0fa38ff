//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/MockExecutor.cpp
// Purpose: In-process, rule-based executor for tests and offline embedding
//==========================================================================================================

#include "rr/MockExecutor.hpp"

#include <map>
#include <mutex>
#include <regex>
#include <thread>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "rr/HttpConstants.h"

namespace rr {

namespace {

struct MockRule {
    Method method;
    std::regex pattern;
    MockExecutor::ResponseFn fn;
};

struct LatencyRule {
    std::regex pattern;
    std::chrono::milliseconds latency;
};

std::string countKey(Method method, const std::string& endpoint) {
    return std::string(ToString(method)) + ":" + endpoint;
}

} // namespace

class MockExecutor::Impl {
public:
    mutable std::mutex mtx;
    std::vector<MockRule> rules;
    std::vector<LatencyRule> latencies;
    Headers responseHeaders;
    std::map<std::string, int> invocations;
    int total{0};
};

MockExecutor::MockExecutor() : pImpl(std::make_unique<Impl>()) {}

MockExecutor::~MockExecutor() = default;

MockExecutor& MockExecutor::AddMockResponse(Method method, const std::string& urlPattern, ResponseFn fn) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->rules.push_back(MockRule{method, std::regex(urlPattern), std::move(fn)});
    return *this;
}

MockExecutor& MockExecutor::AddMockResponse(Method method, const std::string& urlPattern, int status, std::string body) {
    return AddMockResponse(method, urlPattern,
        [status, body = std::move(body)](const std::string&, const std::optional<std::string>&) {
            Response r;
            r.status = status;
            r.body = body;
            return r;
        });
}

MockExecutor& MockExecutor::WithLatency(const std::string& urlPattern, std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->latencies.push_back(LatencyRule{std::regex(urlPattern), latency});
    return *this;
}

MockExecutor& MockExecutor::WithHeader(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->responseHeaders.Set(name, value);
    return *this;
}

Response MockExecutor::Execute(const RequestSpec& spec) {
    const std::string& endpoint = spec.GetEndpoint();
    ResponseFn fn;
    std::chrono::milliseconds latency{0};
    Headers extraHeaders;
    {
        std::lock_guard<std::mutex> lk(pImpl->mtx);
        ++pImpl->invocations[countKey(spec.GetMethod(), endpoint)];
        ++pImpl->total;
        for (const auto& l : pImpl->latencies) {
            if (std::regex_match(endpoint, l.pattern)) {
                latency = l.latency;
                break;
            }
        }
        for (const auto& rule : pImpl->rules) {
            if (rule.method == spec.GetMethod() && std::regex_match(endpoint, rule.pattern)) {
                fn = rule.fn;
                break;
            }
        }
        extraHeaders = pImpl->responseHeaders;
    }

    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }
    if (!fn) {
        LOG_DEBUG("No mock response configured for {}", countKey(spec.GetMethod(), endpoint));
        throw TransportError("No mock response configured for " + countKey(spec.GetMethod(), endpoint),
                             http_status::NOT_FOUND);
    }

    Response res = fn(endpoint, spec.GetBody());
    extraHeaders.Merge(res.headers);
    res.headers = std::move(extraHeaders);
    if (res.status == http_status::UNAUTHORIZED) {
        throw errors::TokenExpiredException(messages::TOKEN_EXPIRED, res.body);
    }
    if (!http_status::IsSuccess(res.status)) {
        throw TransportError(messages::HTTP_FAILED_PREFIX + std::to_string(res.status), res.status, res.body);
    }
    return res;
}

int MockExecutor::GetInvocationCount(Method method, const std::string& endpoint) const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto it = pImpl->invocations.find(countKey(method, endpoint));
    return it == pImpl->invocations.end() ? 0 : it->second;
}

int MockExecutor::GetTotalInvocations() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->total;
}

void MockExecutor::ResetCounts() {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->invocations.clear();
    pImpl->total = 0;
}

} // namespace rr
