//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/interceptor/InterceptingExecutor.hpp
// Purpose: Executor decorator running an ordered list of RequestInterceptors around a delegate
//==========================================================================================================
#pragma once

#include <memory>
#include <vector>

#include "rr/Executor.h"
#include "rr/HttpConstants.h"
#include "rr/interceptor/RequestInterceptor.hpp"

namespace rr {

using InterceptorPtr = std::shared_ptr<RequestInterceptor>;

//==========================================================================================================
// InterceptingExecutor
// Purpose: Applies BeforeRequest in order, executes the delegate, applies AfterResponse in reverse order,
//          and on failure offers the error to each interceptor's OnError in order. The last failure
//          propagates when no interceptor recovers.
//==========================================================================================================
class InterceptingExecutor : public IExecutor {
public:
    //==========================================================================================================
    // Constructor
    // Args:
    //   delegate: Executor to wrap (required).
    //   interceptors: Interceptors in any order; stably sorted by GetOrder().
    //   maxRetries: Global ceiling on InterceptorChain::Retry() calls per logical request.
    // Throws:
    //   std::invalid_argument on a null delegate, null interceptor or negative maxRetries.
    //==========================================================================================================
    InterceptingExecutor(ExecutorPtr delegate,
                         std::vector<InterceptorPtr> interceptors,
                         int maxRetries = defaults::CHAIN_MAX_RETRIES);
    ~InterceptingExecutor() override;

    Response Execute(const RequestSpec& spec) override;

    const std::vector<InterceptorPtr>& GetInterceptors() const;
    int GetMaxRetries() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rr
