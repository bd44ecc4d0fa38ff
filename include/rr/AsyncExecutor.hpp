//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/AsyncExecutor.hpp
// Purpose: Runs a decorated executor on a bounded Boost.Asio worker pool and returns futures
//==========================================================================================================
#pragma once

#include <cstddef>
#include <future>
#include <memory>

#include "rr/Executor.h"
#include "rr/HttpConstants.h"

namespace rr {

//==========================================================================================================
// AsyncExecutor
// Purpose: Asynchronous view over an executor. Each ExecuteAsync() call becomes one delegate execution on
//          a pool thread; the future carries either the Response or the exact exception the synchronous
//          path would have thrown.
//==========================================================================================================
class AsyncExecutor : public IExecutor {
public:
    //==========================================================================================================
    // Constructor
    // Args:
    //   delegate: Executor to run on the pool (required).
    //   poolSize: Number of worker threads (>= 1).
    // Throws:
    //   std::invalid_argument on a null delegate or zero pool size.
    //==========================================================================================================
    AsyncExecutor(ExecutorPtr delegate, std::size_t poolSize = defaults::ASYNC_POOL_SIZE);

    // Calls Shutdown().
    ~AsyncExecutor() override;

    //==========================================================================================================
    // ExecuteAsync
    // Purpose: Schedules the request and returns immediately.
    // Returns:
    //   Future resolving to the Response. After Shutdown() the future holds errors::ConfigException.
    //==========================================================================================================
    std::future<Response> ExecuteAsync(const RequestSpec& spec);

    // Synchronous execution on the caller's thread.
    Response Execute(const RequestSpec& spec) override;

    //==========================================================================================================
    // Shutdown
    // Purpose: Stops accepting work, lets queued and in-flight requests finish and joins the workers.
    //          Safe to call more than once.
    //==========================================================================================================
    void Shutdown();
    bool IsShutdown() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rr
