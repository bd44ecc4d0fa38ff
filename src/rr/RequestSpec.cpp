//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestSpec.cpp
// Purpose: RequestSpec value semantics, method helpers and RequestBuilder
//==========================================================================================================

#include "rr/RequestSpec.h"

#include <cctype>
#include <utility>

#include "rr/errors/Errors.h"

namespace rr {

const char* ToString(Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
        case Method::Put: return "PUT";
        case Method::Patch: return "PATCH";
        case Method::Delete: return "DELETE";
        case Method::Head: return "HEAD";
        case Method::Options: return "OPTIONS";
    }
    return "GET";
}

std::optional<Method> MethodFromString(const std::string& name) {
    std::string s; s.reserve(name.size());
    for (char c : name) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "GET") return Method::Get;
    if (s == "POST") return Method::Post;
    if (s == "PUT") return Method::Put;
    if (s == "PATCH") return Method::Patch;
    if (s == "DELETE") return Method::Delete;
    if (s == "HEAD") return Method::Head;
    if (s == "OPTIONS") return Method::Options;
    return std::nullopt;
}

bool IsIdempotent(Method method) {
    return method != Method::Post && method != Method::Patch;
}

bool MethodHasBody(Method method) {
    return method == Method::Post || method == Method::Put || method == Method::Patch;
}

/////////////////////////////////////////// RequestSpec ///////////////////////////////////////////

RequestSpec::RequestSpec(std::string endpoint,
                         Method method,
                         Headers headers,
                         QueryParams queryParams,
                         std::optional<std::string> body,
                         ResponseShape responseShape,
                         std::optional<Deadline> deadline)
    : endpoint(std::move(endpoint)),
      method(method),
      headers(std::move(headers)),
      queryParams(std::move(queryParams)),
      body(std::move(body)),
      responseShape(responseShape),
      deadline(deadline) {}

bool RequestSpec::HasDeadlinePassed() const {
    return deadline.has_value() && std::chrono::steady_clock::now() >= *deadline;
}

RequestSpec RequestSpec::WithHeaders(Headers newHeaders) const {
    RequestSpec copy(*this);
    copy.headers = std::move(newHeaders);
    return copy;
}

RequestSpec RequestSpec::WithEndpoint(std::string newEndpoint) const {
    RequestSpec copy(*this);
    copy.endpoint = std::move(newEndpoint);
    return copy;
}

std::string RequestSpec::Describe() const {
    return std::string(ToString(method)) + " " + endpoint;
}

////////////////////////////////////////// RequestBuilder //////////////////////////////////////////

RequestBuilder::RequestBuilder() : headers(rr::Headers::DefaultJson()) {}

RequestBuilder::RequestBuilder(std::string endpoint)
    : endpoint(std::move(endpoint)), headers(rr::Headers::DefaultJson()) {}

RequestBuilder RequestBuilder::Get(std::string endpoint) {
    RequestBuilder b(std::move(endpoint));
    b.method = rr::Method::Get;
    return b;
}

RequestBuilder RequestBuilder::Post(std::string endpoint) {
    RequestBuilder b(std::move(endpoint));
    b.method = rr::Method::Post;
    return b;
}

RequestBuilder RequestBuilder::Put(std::string endpoint) {
    RequestBuilder b(std::move(endpoint));
    b.method = rr::Method::Put;
    return b;
}

RequestBuilder RequestBuilder::Patch(std::string endpoint) {
    RequestBuilder b(std::move(endpoint));
    b.method = rr::Method::Patch;
    return b;
}

RequestBuilder RequestBuilder::Delete(std::string endpoint) {
    RequestBuilder b(std::move(endpoint));
    b.method = rr::Method::Delete;
    return b;
}

RequestBuilder& RequestBuilder::Endpoint(std::string value) {
    endpoint = std::move(value);
    return *this;
}

RequestBuilder& RequestBuilder::Method(rr::Method value) {
    method = value;
    return *this;
}

RequestBuilder& RequestBuilder::Header(const std::string& name, const std::string& value) {
    headers.Set(name, value);
    return *this;
}

RequestBuilder& RequestBuilder::Headers(rr::Headers value) {
    headers = std::move(value);
    return *this;
}

RequestBuilder& RequestBuilder::Query(const std::string& name, const std::string& value) {
    queryParams[name] = value;
    return *this;
}

RequestBuilder& RequestBuilder::QueryParams(rr::QueryParams value) {
    queryParams = std::move(value);
    return *this;
}

RequestBuilder& RequestBuilder::Body(std::string value) {
    body = std::move(value);
    return *this;
}

RequestBuilder& RequestBuilder::Shape(ResponseShape value) {
    responseShape = value;
    return *this;
}

RequestBuilder& RequestBuilder::Timeout(std::chrono::milliseconds timeout) {
    deadline = std::chrono::steady_clock::now() + timeout;
    return *this;
}

RequestBuilder& RequestBuilder::Deadline(rr::Deadline value) {
    deadline = value;
    return *this;
}

RequestSpec RequestBuilder::Build() const {
    if (endpoint.empty()) {
        throw errors::ConfigException("Request endpoint must not be empty");
    }
    return RequestSpec(endpoint, method, headers, queryParams, body, responseShape, deadline);
}

} // namespace rr
