//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestSpec.h
// Purpose: Immutable description of one logical HTTP call and its builder
//==========================================================================================================
#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "rr/Headers.hpp"

namespace rr {

enum class Method {
    Get,
    Post,
    Put,
    Patch,
    Delete,
    Head,
    Options
};

const char* ToString(Method method);
std::optional<Method> MethodFromString(const std::string& name);

// GET, HEAD, OPTIONS, PUT and DELETE may be repeated without additional side effects.
bool IsIdempotent(Method method);
bool MethodHasBody(Method method);

// Declared shape of the expected response body. Decoding is left to the caller.
enum class ResponseShape {
    Text,
    Json,
    None
};

using QueryParams = std::map<std::string, std::string>;
using Deadline = std::chrono::steady_clock::time_point;

class RequestBuilder;

//==========================================================================================================
// RequestSpec
// Purpose: Value type consumed by every IExecutor. Instances are never mutated after construction;
//          decorators derive modified copies through the With* helpers.
//==========================================================================================================
class RequestSpec {
public:
    RequestSpec(std::string endpoint,
                Method method,
                Headers headers,
                QueryParams queryParams = {},
                std::optional<std::string> body = std::nullopt,
                ResponseShape responseShape = ResponseShape::Json,
                std::optional<Deadline> deadline = std::nullopt);

    const std::string& GetEndpoint() const { return endpoint; }
    Method GetMethod() const { return method; }
    const Headers& GetHeaders() const { return headers; }
    const QueryParams& GetQueryParams() const { return queryParams; }
    const std::optional<std::string>& GetBody() const { return body; }
    ResponseShape GetResponseShape() const { return responseShape; }
    const std::optional<Deadline>& GetDeadline() const { return deadline; }

    bool HasDeadlinePassed() const;

    RequestSpec WithHeaders(Headers newHeaders) const;
    RequestSpec WithEndpoint(std::string newEndpoint) const;

    // "GET /users" style summary for log lines.
    std::string Describe() const;

private:
    std::string endpoint;
    Method method;
    Headers headers;
    QueryParams queryParams;
    std::optional<std::string> body;
    ResponseShape responseShape;
    std::optional<Deadline> deadline;
};

//==========================================================================================================
// RequestBuilder
// Purpose: Fluent construction of RequestSpec. Requests start from Headers::DefaultJson() unless a full
//          header set is supplied through Headers().
//==========================================================================================================
class RequestBuilder {
public:
    RequestBuilder();
    explicit RequestBuilder(std::string endpoint);

    static RequestBuilder Get(std::string endpoint);
    static RequestBuilder Post(std::string endpoint);
    static RequestBuilder Put(std::string endpoint);
    static RequestBuilder Patch(std::string endpoint);
    static RequestBuilder Delete(std::string endpoint);

    RequestBuilder& Endpoint(std::string value);
    RequestBuilder& Method(rr::Method value);
    RequestBuilder& Header(const std::string& name, const std::string& value);
    RequestBuilder& Headers(rr::Headers value);
    RequestBuilder& Query(const std::string& name, const std::string& value);
    RequestBuilder& QueryParams(rr::QueryParams value);
    RequestBuilder& Body(std::string value);
    RequestBuilder& Shape(ResponseShape value);
    RequestBuilder& Timeout(std::chrono::milliseconds timeout);
    RequestBuilder& Deadline(rr::Deadline value);

    //==========================================================================================================
    // Build
    // Purpose: Produces the immutable RequestSpec.
    // Throws:
    //   errors::ConfigException when no endpoint was set.
    //==========================================================================================================
    RequestSpec Build() const;

private:
    std::string endpoint;
    rr::Method method{rr::Method::Get};
    rr::Headers headers;
    rr::QueryParams queryParams;
    std::optional<std::string> body;
    ResponseShape responseShape{ResponseShape::Json};
    std::optional<rr::Deadline> deadline;
};

} // namespace rr
