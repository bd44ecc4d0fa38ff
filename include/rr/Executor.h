//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Executor.h
// Purpose: Executor abstraction shared by the base transport and every decorator in the request chain
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>

#include "rr/RequestSpec.h"
#include "rr/Response.h"
#include "rr/errors/Errors.h"

namespace rr {

//==========================================================================================================
// IExecutor
// Purpose: Performs one request. Decorators wrap another IExecutor and add behaviour (circuit breaking,
//          interception, timing) without changing this contract.
//==========================================================================================================
class IExecutor {
public:
    virtual ~IExecutor() = default;

    //==========================================================================================================
    // Executes the request and returns its response.
    // Args:
    //   spec: Immutable request description.
    // Returns:
    //   Response with a 2xx status.
    // Throws:
    //   errors::TransportError (or a subclass) on any failure.
    //==========================================================================================================
    virtual Response Execute(const RequestSpec& spec) = 0;
};

using ExecutorPtr = std::shared_ptr<IExecutor>;

// Wraps an executor in another; used for caller-provided decorators.
using ExecutorDecorator = std::function<ExecutorPtr(ExecutorPtr)>;

} // namespace rr
