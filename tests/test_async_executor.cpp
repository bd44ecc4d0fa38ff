//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_async_executor.cpp
// Purpose: GoogleTests for the worker-pool adapter: futures, exception fidelity and shutdown
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <vector>

#include "rr/AsyncExecutor.hpp"
#include "rr/CircuitBreakerExecutor.hpp"
#include "rr/MockExecutor.hpp"

using namespace rr;

TEST(AsyncExecutor, ResolvesResponse) {
    auto mock = std::make_shared<MockExecutor>();
    mock->AddMockResponse(Method::Get, "/users/1", 200, "{\"id\":1}");
    AsyncExecutor async(mock, 2);
    auto fut = async.ExecuteAsync(RequestBuilder::Get("/users/1").Build());
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(fut.get().body, "{\"id\":1}");
}

TEST(AsyncExecutor, PreservesExceptionType) {
    auto mock = std::make_shared<MockExecutor>();
    mock->AddMockResponse(Method::Get, "/gone", 410, "bye");
    mock->AddMockResponse(Method::Get, "/auth", 401, "");
    mock->AddMockResponse(Method::Get, "/net", [](const std::string&, const std::optional<std::string>&) -> Response {
        throw errors::NetworkException("Connection reset");
    });
    AsyncExecutor async(mock, 2);

    auto gone = async.ExecuteAsync(RequestBuilder::Get("/gone").Build());
    try {
        gone.get();
        FAIL() << "expected failure";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.StatusCode(), 410);
        EXPECT_EQ(e.ResponseBody().value_or(""), "bye");
    }

    EXPECT_THROW(async.ExecuteAsync(RequestBuilder::Get("/auth").Build()).get(), errors::TokenExpiredException);
    EXPECT_THROW(async.ExecuteAsync(RequestBuilder::Get("/net").Build()).get(), errors::NetworkException);
}

TEST(AsyncExecutor, ConcurrentCallsAgainstTrippingBreaker) {
    // The first two calls reaching the backend succeed; every later one fails with 500.
    auto served = std::make_shared<std::atomic<int>>(0);
    auto mock = std::make_shared<MockExecutor>();
    mock->AddMockResponse(Method::Get, ".*", [served](const std::string&, const std::optional<std::string>&) {
        Response r;
        r.status = served->fetch_add(1) < 2 ? 200 : 500;
        return r;
    });
    mock->WithLatency(".*", std::chrono::milliseconds(5));

    CircuitBreakerExecutor::Options o;
    o.failureThreshold = 2;
    o.resetTimeout = std::chrono::minutes(10);
    auto breaker = std::make_shared<CircuitBreakerExecutor>(mock, o);
    AsyncExecutor async(breaker, 4);

    std::vector<std::future<Response>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(async.ExecuteAsync(RequestBuilder::Get("/items").Build()));
    }

    int successes = 0, failures = 0, circuitOpen = 0;
    for (auto& f : futures) {
        ASSERT_EQ(f.wait_for(std::chrono::seconds(10)), std::future_status::ready);
        try {
            f.get();
            ++successes;
        } catch (const errors::CircuitBreakerOpenException&) {
            ++circuitOpen;
            ++failures;
        } catch (const TransportError&) {
            ++failures;
        }
    }
    EXPECT_EQ(successes + failures, 5);
    EXPECT_EQ(successes, 2);
    EXPECT_GE(circuitOpen, 1);
    EXPECT_EQ(breaker->GetState(), CircuitBreakerExecutor::State::Open);
}

TEST(AsyncExecutor, ShutdownDrainsQueuedWork) {
    auto mock = std::make_shared<MockExecutor>();
    mock->AddMockResponse(Method::Get, "/slow", 200, "done");
    mock->WithLatency("/slow", std::chrono::milliseconds(50));
    AsyncExecutor async(mock, 1);

    auto first = async.ExecuteAsync(RequestBuilder::Get("/slow").Build());
    auto second = async.ExecuteAsync(RequestBuilder::Get("/slow").Build());
    async.Shutdown();
    EXPECT_TRUE(async.IsShutdown());
    EXPECT_EQ(first.get().body, "done");
    EXPECT_EQ(second.get().body, "done");
    EXPECT_EQ(mock->GetTotalInvocations(), 2);
}

TEST(AsyncExecutor, RejectsWorkAfterShutdown) {
    auto mock = std::make_shared<MockExecutor>();
    mock->AddMockResponse(Method::Get, "/x", 200, "ok");
    AsyncExecutor async(mock, 1);
    async.Shutdown();
    async.Shutdown();

    auto fut = async.ExecuteAsync(RequestBuilder::Get("/x").Build());
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_THROW(fut.get(), errors::ConfigException);
    EXPECT_EQ(mock->GetTotalInvocations(), 0);

    // The synchronous path still reaches the delegate.
    EXPECT_EQ(async.Execute(RequestBuilder::Get("/x").Build()).body, "ok");
}

TEST(AsyncExecutor, RejectsInvalidArguments) {
    auto mock = std::make_shared<MockExecutor>();
    EXPECT_THROW(AsyncExecutor(nullptr, 2), std::invalid_argument);
    EXPECT_THROW(AsyncExecutor(mock, 0), std::invalid_argument);
}
