//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/RestClient.cpp
// Purpose: Client facade exposing synchronous, asynchronous and Result-returning views over one chain
//==========================================================================================================

#include "rr/RestClient.hpp"

#include <utility>

#include "rr/ClientFactory.hpp"

namespace rr {

namespace {

RequestSpec getSpec(const std::string& endpoint, const QueryParams& query) {
    return RequestBuilder::Get(endpoint).QueryParams(query).Build();
}

RequestSpec bodySpec(Method method, const std::string& endpoint, const std::string& body) {
    return RequestBuilder(endpoint).Method(method).Body(body).Build();
}

RequestSpec deleteSpec(const std::string& endpoint) {
    return RequestBuilder::Delete(endpoint).Build();
}

std::shared_ptr<RequestOrchestrator> makeOrchestrator(ClientConfig& config, ExecutorPtr executor) {
    if (!executor) {
        executor = ClientBuilder(config.baseUrl).WithOptions(config.options).Build();
    }
    return std::make_shared<RequestOrchestrator>(std::move(executor), config);
}

} // namespace

////////////////////////////////////////// SyncApi //////////////////////////////////////////

Response RestClient::SyncApi::Get(const std::string& endpoint, const QueryParams& query) {
    return exec->Execute(getSpec(endpoint, query));
}

Response RestClient::SyncApi::Post(const std::string& endpoint, const std::string& body) {
    return exec->Execute(bodySpec(Method::Post, endpoint, body));
}

Response RestClient::SyncApi::Put(const std::string& endpoint, const std::string& body) {
    return exec->Execute(bodySpec(Method::Put, endpoint, body));
}

Response RestClient::SyncApi::Delete(const std::string& endpoint) {
    return exec->Execute(deleteSpec(endpoint));
}

Response RestClient::SyncApi::Execute(const RequestSpec& spec) {
    return exec->Execute(spec);
}

////////////////////////////////////////// AsyncApi //////////////////////////////////////////

std::future<Response> RestClient::AsyncApi::Get(const std::string& endpoint, const QueryParams& query) {
    return exec->ExecuteAsync(getSpec(endpoint, query));
}

std::future<Response> RestClient::AsyncApi::Post(const std::string& endpoint, const std::string& body) {
    return exec->ExecuteAsync(bodySpec(Method::Post, endpoint, body));
}

std::future<Response> RestClient::AsyncApi::Put(const std::string& endpoint, const std::string& body) {
    return exec->ExecuteAsync(bodySpec(Method::Put, endpoint, body));
}

std::future<Response> RestClient::AsyncApi::Delete(const std::string& endpoint) {
    return exec->ExecuteAsync(deleteSpec(endpoint));
}

std::future<Response> RestClient::AsyncApi::Execute(const RequestSpec& spec) {
    return exec->ExecuteAsync(spec);
}

////////////////////////////////////////// FluentApi //////////////////////////////////////////

ApiResult RestClient::FluentApi::Get(const std::string& endpoint, const QueryParams& query) {
    return exec->ExecuteWithResult(getSpec(endpoint, query));
}

ApiResult RestClient::FluentApi::Post(const std::string& endpoint, const std::string& body) {
    return exec->ExecuteWithResult(bodySpec(Method::Post, endpoint, body));
}

ApiResult RestClient::FluentApi::Put(const std::string& endpoint, const std::string& body) {
    return exec->ExecuteWithResult(bodySpec(Method::Put, endpoint, body));
}

ApiResult RestClient::FluentApi::Delete(const std::string& endpoint) {
    return exec->ExecuteWithResult(deleteSpec(endpoint));
}

ApiResult RestClient::FluentApi::Execute(const RequestSpec& spec) {
    return exec->ExecuteWithResult(spec);
}

////////////////////////////////////////// RestClient //////////////////////////////////////////

RestClient::RestClient(ClientConfig config, ExecutorPtr executor)
    : orchestrator(makeOrchestrator(config, std::move(executor))),
      asyncExec(std::make_shared<AsyncExecutor>(orchestrator, config.options.asyncPoolSize)),
      fluentExec(std::make_shared<FluentExecutor>(orchestrator, config.baseUrl)),
      syncApi(orchestrator),
      asyncApi(asyncExec),
      fluentApi(fluentExec) {}

RestClient::~RestClient() {
    Shutdown();
}

void RestClient::Shutdown() {
    asyncExec->Shutdown();
}

} // namespace rr
