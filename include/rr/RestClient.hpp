//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/RestClient.hpp
// Purpose: Client facade exposing synchronous, asynchronous and Result-returning views over one chain
//==========================================================================================================
#pragma once

#include <future>
#include <memory>
#include <string>

#include "rr/AsyncExecutor.hpp"
#include "rr/FluentExecutor.hpp"
#include "rr/RequestOrchestrator.hpp"

namespace rr {

//==========================================================================================================
// RestClient
// Purpose: Owns one RequestOrchestrator over the decorated chain, plus an AsyncExecutor and a
//          FluentExecutor layered on that orchestrator. Every view sees the same breaker state and the same
//          authentication strategy.
//==========================================================================================================
class RestClient {
public:
    // Throwing view.
    class SyncApi {
    public:
        explicit SyncApi(std::shared_ptr<RequestOrchestrator> exec) : exec(std::move(exec)) {}
        Response Get(const std::string& endpoint, const QueryParams& query = {});
        Response Post(const std::string& endpoint, const std::string& body);
        Response Put(const std::string& endpoint, const std::string& body);
        Response Delete(const std::string& endpoint);
        Response Execute(const RequestSpec& spec);

    private:
        std::shared_ptr<RequestOrchestrator> exec;
    };

    // Future-returning view; failures arrive through the future.
    class AsyncApi {
    public:
        explicit AsyncApi(std::shared_ptr<AsyncExecutor> exec) : exec(std::move(exec)) {}
        std::future<Response> Get(const std::string& endpoint, const QueryParams& query = {});
        std::future<Response> Post(const std::string& endpoint, const std::string& body);
        std::future<Response> Put(const std::string& endpoint, const std::string& body);
        std::future<Response> Delete(const std::string& endpoint);
        std::future<Response> Execute(const RequestSpec& spec);

    private:
        std::shared_ptr<AsyncExecutor> exec;
    };

    // Result-returning view; never throws for request failures.
    class FluentApi {
    public:
        explicit FluentApi(std::shared_ptr<FluentExecutor> exec) : exec(std::move(exec)) {}
        ApiResult Get(const std::string& endpoint, const QueryParams& query = {});
        ApiResult Post(const std::string& endpoint, const std::string& body);
        ApiResult Put(const std::string& endpoint, const std::string& body);
        ApiResult Delete(const std::string& endpoint);
        ApiResult Execute(const RequestSpec& spec);

    private:
        std::shared_ptr<FluentExecutor> exec;
    };

    //==========================================================================================================
    // Constructor
    // Args:
    //   config: Base URL, options, default headers and auth strategy.
    //   executor: Already decorated chain. When null the chain is built by ClientBuilder from config.
    //==========================================================================================================
    explicit RestClient(ClientConfig config, ExecutorPtr executor = nullptr);
    ~RestClient();

    SyncApi& Sync() { return syncApi; }
    AsyncApi& Async() { return asyncApi; }
    FluentApi& Fluent() { return fluentApi; }

    const ClientConfig& GetConfig() const { return orchestrator->GetConfig(); }

    // Stops the async worker pool. Sync and fluent views keep working.
    void Shutdown();

private:
    std::shared_ptr<RequestOrchestrator> orchestrator;
    std::shared_ptr<AsyncExecutor> asyncExec;
    std::shared_ptr<FluentExecutor> fluentExec;
    SyncApi syncApi;
    AsyncApi asyncApi;
    FluentApi fluentApi;
};

} // namespace rr
