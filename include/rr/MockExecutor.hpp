//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/MockExecutor.hpp
// Purpose: In-process, rule-based executor for tests and offline embedding
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "rr/Executor.h"

namespace rr {

//==========================================================================================================
// MockExecutor
// Purpose: Answers requests from registered rules instead of the network. A rule matches on method and a
//          regular expression over the whole endpoint; the first matching rule wins.
// Notes:
//   - Non-2xx responses produced by a rule are reported the way HttpExecutor reports them (401 as
//     errors::TokenExpiredException, others as TransportError carrying status and body).
//   - A rule function may throw any TransportError to simulate network or other failures.
//   - Requests without a matching rule fail with status 404.
//   - All members are safe to call concurrently.
//==========================================================================================================
class MockExecutor : public IExecutor {
public:
    using ResponseFn = std::function<Response(const std::string& endpoint, const std::optional<std::string>& body)>;

    MockExecutor();
    ~MockExecutor() override;

    MockExecutor& AddMockResponse(Method method, const std::string& urlPattern, ResponseFn fn);

    // Shorthand for a fixed status and body.
    MockExecutor& AddMockResponse(Method method, const std::string& urlPattern, int status, std::string body);

    // Sleeps before answering requests whose endpoint matches urlPattern.
    MockExecutor& WithLatency(const std::string& urlPattern, std::chrono::milliseconds latency);

    // Header added to every response.
    MockExecutor& WithHeader(const std::string& name, const std::string& value);

    Response Execute(const RequestSpec& spec) override;

    int GetInvocationCount(Method method, const std::string& endpoint) const;
    int GetTotalInvocations() const;
    void ResetCounts();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rr
