//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/AsyncExecutor.cpp
// Purpose: Worker-pool adapter built on boost::asio::thread_pool
//==========================================================================================================

#include "rr/AsyncExecutor.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"

namespace rr {
namespace net = boost::asio;

class AsyncExecutor::Impl {
public:
    ExecutorPtr delegate;
    net::thread_pool pool;
    std::atomic<bool> shutdown{false};
    std::mutex submitMutex; // orders submissions against Shutdown()
    std::once_flag joinOnce;

    Impl(ExecutorPtr d, std::size_t size) : delegate(std::move(d)), pool(size) {}
};

AsyncExecutor::AsyncExecutor(ExecutorPtr delegate, std::size_t poolSize) {
    if (!delegate) {
        throw std::invalid_argument("delegate must not be null");
    }
    if (poolSize == 0) {
        throw std::invalid_argument("poolSize must be at least 1");
    }
    pImpl = std::make_unique<Impl>(std::move(delegate), poolSize);
    LOG_DEBUG("AsyncExecutor started with {} worker(s)", poolSize);
}

AsyncExecutor::~AsyncExecutor() {
    Shutdown();
}

std::future<Response> AsyncExecutor::ExecuteAsync(const RequestSpec& spec) {
    FUNC_SCOPE();
    auto promise = std::make_shared<std::promise<Response>>();
    auto fut = promise->get_future();

    std::lock_guard<std::mutex> lk(pImpl->submitMutex);
    if (pImpl->shutdown.load(std::memory_order_acquire)) {
        promise->set_exception(std::make_exception_ptr(errors::ConfigException(messages::EXECUTOR_SHUT_DOWN)));
        return fut;
    }

    ExecutorPtr delegate = pImpl->delegate;
    net::post(pImpl->pool, [delegate, spec, promise]() {
        try {
            promise->set_value(delegate->Execute(spec));
        } catch (...) {
            // Delivered to the caller through the future.
            promise->set_exception(std::current_exception());
        }
    });
    return fut;
}

Response AsyncExecutor::Execute(const RequestSpec& spec) {
    return pImpl->delegate->Execute(spec);
}

void AsyncExecutor::Shutdown() {
    {
        std::lock_guard<std::mutex> lk(pImpl->submitMutex);
        pImpl->shutdown.store(true, std::memory_order_release);
    }
    std::call_once(pImpl->joinOnce, [this]() {
        LOG_DEBUG("AsyncExecutor shutting down; draining queued work");
        pImpl->pool.join();
    });
}

bool AsyncExecutor::IsShutdown() const {
    return pImpl->shutdown.load(std::memory_order_acquire);
}

} // namespace rr
