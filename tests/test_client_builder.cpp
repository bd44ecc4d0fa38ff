//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client_builder.cpp
// Purpose: GoogleTests for ClientBuilder decorator composition
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "rr/ClientFactory.hpp"
#include "rr/MockExecutor.hpp"

using namespace rr;

namespace {

// Appends its tag to a shared trace, then delegates.
class TaggingExecutor : public IExecutor {
public:
    TaggingExecutor(ExecutorPtr inner, std::string tag, std::shared_ptr<std::vector<std::string>> trace)
        : inner(std::move(inner)), tag(std::move(tag)), trace(std::move(trace)) {}

    Response Execute(const RequestSpec& spec) override {
        trace->push_back(tag);
        return inner->Execute(spec);
    }

private:
    ExecutorPtr inner;
    std::string tag;
    std::shared_ptr<std::vector<std::string>> trace;
};

std::shared_ptr<MockExecutor> statusBackend(std::shared_ptr<std::atomic<int>> status) {
    auto mock = std::make_shared<MockExecutor>();
    mock->AddMockResponse(Method::Get, ".*", [status](const std::string&, const std::optional<std::string>&) {
        Response r;
        r.status = status->load();
        return r;
    });
    return mock;
}

RequestSpec get() {
    return RequestBuilder::Get("/orders").Build();
}

} // namespace

TEST(ClientBuilder, BareTransportIsReturnedUndecorated) {
    auto mock = std::make_shared<MockExecutor>();
    ExecutorPtr exec = ClientBuilder().WithTransport(mock).Build();
    EXPECT_EQ(exec, mock);
}

TEST(ClientBuilder, BreakerWrapsRetryChain) {
    auto status = std::make_shared<std::atomic<int>>(500);
    auto mock = statusBackend(status);
    ExecutorPtr exec = ClientBuilder()
        .WithTransport(mock)
        .WithRetry(2, std::chrono::milliseconds(1), 1.0)
        .WithCircuitBreaker(1, std::chrono::minutes(5))
        .Build();

    auto* breaker = dynamic_cast<CircuitBreakerExecutor*>(exec.get());
    ASSERT_NE(breaker, nullptr);

    // One logical request: three attempts inside the retry chain, one countable failure at the breaker.
    try {
        exec->Execute(get());
        FAIL() << "expected the breaker to trip";
    } catch (const errors::CircuitBreakerOpenException& e) {
        EXPECT_TRUE(e.TrippedByThisRequest());
        ASSERT_TRUE(e.Cause());
        try {
            std::rethrow_exception(e.Cause());
        } catch (const TransportError& cause) {
            EXPECT_EQ(cause.StatusCode(), 500);
        }
    }
    EXPECT_EQ(mock->GetTotalInvocations(), 3);

    EXPECT_THROW(exec->Execute(get()), errors::CircuitBreakerOpenException);
    EXPECT_EQ(mock->GetTotalInvocations(), 3);
    EXPECT_EQ(breaker->GetMetrics().circuitTrips, 1u);
}

TEST(ClientBuilder, CustomDecoratorsWrapInRegistrationOrder) {
    auto trace = std::make_shared<std::vector<std::string>>();
    auto mock = std::make_shared<MockExecutor>();
    mock->AddMockResponse(Method::Get, ".*", 200, "ok");

    ExecutorPtr exec = ClientBuilder()
        .WithTransport(mock)
        .WithCustomDecorator([trace](ExecutorPtr inner) {
            return std::make_shared<TaggingExecutor>(std::move(inner), "first", trace);
        })
        .WithCustomDecorator([trace](ExecutorPtr inner) {
            return std::make_shared<TaggingExecutor>(std::move(inner), "second", trace);
        })
        .Build();

    EXPECT_EQ(exec->Execute(get()).body, "ok");
    ASSERT_EQ(trace->size(), 2u);
    EXPECT_EQ((*trace)[0], "second");
    EXPECT_EQ((*trace)[1], "first");
}

TEST(ClientBuilder, OptionsEnableBreaker) {
    auto status = std::make_shared<std::atomic<int>>(503);
    auto mock = statusBackend(status);
    ClientOptions opts;
    opts.circuitBreakerEnabled = true;
    opts.circuitBreakerFailureThreshold = 2;
    opts.circuitBreakerResetTimeoutMs = 60000;

    ExecutorPtr exec = ClientBuilder().WithOptions(opts).WithTransport(mock).Build();
    auto* breaker = dynamic_cast<CircuitBreakerExecutor*>(exec.get());
    ASSERT_NE(breaker, nullptr);
    EXPECT_EQ(breaker->GetMetrics().failureThreshold, 2);

    EXPECT_THROW(exec->Execute(get()), TransportError);
    EXPECT_EQ(breaker->GetState(), CircuitBreakerExecutor::State::Closed);
    EXPECT_THROW(exec->Execute(get()), errors::CircuitBreakerOpenException);
    EXPECT_EQ(breaker->GetState(), CircuitBreakerExecutor::State::Open);
}

TEST(ClientBuilder, BuilderBreakerSettingsWinOverOptions) {
    ClientOptions opts;
    opts.circuitBreakerEnabled = true;
    opts.circuitBreakerFailureThreshold = 9;
    ExecutorPtr exec = ClientBuilder()
        .WithOptions(opts)
        .WithTransport(std::make_shared<MockExecutor>())
        .WithCircuitBreaker(3, std::chrono::seconds(1))
        .Build();
    auto* breaker = dynamic_cast<CircuitBreakerExecutor*>(exec.get());
    ASSERT_NE(breaker, nullptr);
    EXPECT_EQ(breaker->GetMetrics().failureThreshold, 3);
}

TEST(ClientBuilder, FailurePredicateSelectsCustomPolicy) {
    auto status = std::make_shared<std::atomic<int>>(500);
    auto mock = statusBackend(status);
    ExecutorPtr exec = ClientBuilder()
        .WithTransport(mock)
        .WithCircuitBreaker(1, std::chrono::seconds(30))
        .WithFailurePredicate([](const TransportError& e) { return e.StatusCode() == 502; })
        .Build();

    for (int i = 0; i < 3; ++i) {
        EXPECT_THROW(exec->Execute(get()), TransportError);
    }
    auto* breaker = dynamic_cast<CircuitBreakerExecutor*>(exec.get());
    ASSERT_NE(breaker, nullptr);
    EXPECT_EQ(breaker->GetState(), CircuitBreakerExecutor::State::Closed);

    status->store(502);
    EXPECT_THROW(exec->Execute(get()), errors::CircuitBreakerOpenException);
    EXPECT_EQ(breaker->GetState(), CircuitBreakerExecutor::State::Open);
}

TEST(ClientBuilder, ClockDrivesBreakerRecovery) {
    auto now = std::make_shared<std::atomic<std::int64_t>>(0);
    auto status = std::make_shared<std::atomic<int>>(500);
    auto mock = statusBackend(status);
    ExecutorPtr exec = ClientBuilder()
        .WithTransport(mock)
        .WithCircuitBreaker(1, std::chrono::milliseconds(1000))
        .WithClock([now]() { return now->load(); })
        .Build();

    EXPECT_THROW(exec->Execute(get()), errors::CircuitBreakerOpenException);
    now->store(999);
    EXPECT_THROW(exec->Execute(get()), errors::CircuitBreakerOpenException);
    EXPECT_EQ(mock->GetTotalInvocations(), 1);

    now->store(1000);
    status->store(200);
    EXPECT_EQ(exec->Execute(get()).status, 200);
    EXPECT_EQ(mock->GetTotalInvocations(), 2);
}

TEST(ClientBuilder, FluentAndAsyncViews) {
    auto mock = std::make_shared<MockExecutor>();
    mock->AddMockResponse(Method::Get, "/orders", 200, "[]");

    auto fluent = ClientBuilder("https://api.example.com").WithTransport(mock).BuildFluent();
    EXPECT_TRUE(fluent->ExecuteWithResult(get()).IsSuccess());
    auto conflict = fluent->ExecuteWithResult(RequestBuilder::Get("https://evil.example.com/orders").Build());
    ASSERT_TRUE(conflict.IsFailure());
    EXPECT_TRUE(conflict.Error().Is(ErrorType::ConfigError));

    auto async = ClientBuilder().WithTransport(mock).BuildAsync(2);
    EXPECT_EQ(async->ExecuteAsync(get()).get().body, "[]");
    async->Shutdown();
}

TEST(ClientBuilder, RejectsNullParts) {
    ClientBuilder b;
    EXPECT_THROW(b.WithInterceptor(nullptr), std::invalid_argument);
    EXPECT_THROW(b.WithCustomDecorator(nullptr), std::invalid_argument);

    auto mock = std::make_shared<MockExecutor>();
    ClientBuilder nullDecorator;
    nullDecorator.WithTransport(mock).WithCustomDecorator([](ExecutorPtr) { return ExecutorPtr(); });
    EXPECT_THROW(nullDecorator.Build(), std::invalid_argument);

    ClientBuilder badBreaker;
    badBreaker.WithTransport(mock).WithCircuitBreaker(0, std::chrono::seconds(1));
    EXPECT_THROW(badBreaker.Build(), std::invalid_argument);
}

TEST(ClientBuilder, MisuseNeverTripsBreaker) {
    ClientOptions opts;
    opts.circuitBreakerEnabled = true;
    opts.circuitBreakerFailureThreshold = 1;
    ExecutorPtr exec = ClientBuilder("http://127.0.0.1:1").WithOptions(opts).Build();
    auto* breaker = dynamic_cast<CircuitBreakerExecutor*>(exec.get());
    ASSERT_NE(breaker, nullptr);

    for (int i = 0; i < 3; ++i) {
        EXPECT_THROW(exec->Execute(RequestBuilder::Get("http://example.com/x").Build()), errors::ConfigException);
    }
    EXPECT_EQ(breaker->GetState(), CircuitBreakerExecutor::State::Closed);
    auto m = breaker->GetMetrics();
    EXPECT_EQ(m.failedRequests, 0u);
    EXPECT_EQ(m.circuitTrips, 0u);
}
