//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/RequestOrchestrator.hpp
// Purpose: Applies default and auth headers, times requests and drives the token refresh loop
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include "rr/ClientOptions.hpp"
#include "rr/Executor.h"
#include "rr/Headers.hpp"
#include "rr/auth/IAuthStrategy.hpp"

namespace rr {

//==========================================================================================================
// ClientConfig
// Purpose: Everything a client needs besides the executor chain itself.
// Fields:
//   baseUrl: Prefix for relative endpoints (may be empty).
//   options: Static knobs read once at build time.
//   defaultHeaders: Merged beneath every request's own headers.
//   auth: Authentication strategy; NoAuth when null.
//==========================================================================================================
struct ClientConfig {
    std::string baseUrl;
    ClientOptions options;
    Headers defaultHeaders;
    auth::AuthStrategyPtr auth;
};

//==========================================================================================================
// RequestOrchestrator
// Purpose: Outermost synchronous layer of a client. Unauthorized failures trigger refresh() and a retry
//          with one fewer attempt left; once none remain the caller receives
//          errors::TokenRefreshExhaustedException with the last expiry failure as cause.
// Notes:
//   - Circuit-open failures are never refreshed or retried here; they propagate unchanged.
//   - All other failures pass straight through. Generic retries belong to the interceptor chain.
//==========================================================================================================
class RequestOrchestrator : public IExecutor {
public:
    //==========================================================================================================
    // Constructor
    // Args:
    //   delegate: Decorated executor chain (required).
    //   config: Client configuration. A null auth strategy is replaced by NoAuth.
    // Throws:
    //   std::invalid_argument on a null delegate.
    //==========================================================================================================
    RequestOrchestrator(ExecutorPtr delegate, ClientConfig config);
    ~RequestOrchestrator() override;

    // Executes with options.maxRetries refresh attempts available.
    Response Execute(const RequestSpec& spec) override;

    //==========================================================================================================
    // ExecuteWithRetry
    // Args:
    //   spec: Request as supplied by the caller.
    //   retriesLeft: Remaining refresh attempts.
    // Throws:
    //   errors::TokenRefreshExhaustedException when a 401 persists after the last attempt.
    //   Any other TransportError from the chain, unchanged.
    //==========================================================================================================
    Response ExecuteWithRetry(const RequestSpec& spec, int retriesLeft);

    const ClientConfig& GetConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rr
