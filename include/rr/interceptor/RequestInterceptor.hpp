//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/interceptor/RequestInterceptor.hpp
// Purpose: Interceptor hooks and the retry chain context handed to them
//==========================================================================================================
#pragma once

#include "rr/RequestSpec.h"
#include "rr/Response.h"
#include "rr/errors/Errors.h"

namespace rr {

//==========================================================================================================
// InterceptorChain
// Purpose: Per-attempt context passed to RequestInterceptor::OnError. Retry() re-enters the full
//          interceptor pipeline with an incremented retry count.
//==========================================================================================================
class InterceptorChain {
public:
    virtual ~InterceptorChain() = default;

    //==========================================================================================================
    // Re-executes the request through every interceptor and the delegate.
    // Throws:
    //   errors::TransportError "Maximum retry count exceeded: N" once the global ceiling is reached,
    //   or the failure of the re-executed attempt.
    //==========================================================================================================
    virtual Response Retry(const RequestSpec& spec) = 0;

    // Retries already performed for this logical call (0 on the first attempt).
    virtual int GetRetryCount() const = 0;

    // Global ceiling shared by all interceptors of the executor.
    virtual int GetMaxRetries() const = 0;
};

//==========================================================================================================
// RequestInterceptor
// Purpose: Cross-cutting hook around request execution. Interceptors run sorted by GetOrder(): lower
//          values see BeforeRequest first and AfterResponse last. OnError is offered the failure in the
//          same order; the first interceptor that returns a Response recovers the call.
//==========================================================================================================
class RequestInterceptor {
public:
    virtual ~RequestInterceptor() = default;

    virtual RequestSpec BeforeRequest(const RequestSpec& spec) { return spec; }

    virtual Response AfterResponse(Response response, const RequestSpec& spec) {
        (void)spec;
        return response;
    }

    //==========================================================================================================
    // OnError
    // Purpose: Recovers from a failure or rethrows one. The default rethrows the original failure.
    // Args:
    //   error: The failure raised by the delegate or by a previous interceptor.
    //   spec: The request as it was sent.
    //   chain: Retry context for this attempt.
    // Returns:
    //   Recovered response.
    //==========================================================================================================
    virtual Response OnError(const errors::TransportError& error, const RequestSpec& spec, InterceptorChain& chain) {
        (void)spec;
        (void)chain;
        error.Raise();
        throw;
    }

    virtual int GetOrder() const { return 0; }
};

} // namespace rr
