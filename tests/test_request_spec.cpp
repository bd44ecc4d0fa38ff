//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_request_spec.cpp
// Purpose: GoogleTests for Headers, RequestSpec/RequestBuilder and URL helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "rr/Headers.hpp"
#include "rr/RequestSpec.h"
#include "rr/UrlUtils.h"
#include "rr/errors/Errors.h"

using namespace rr;

TEST(Headers, CaseInsensitiveSetKeepsPosition) {
    Headers h;
    h.Set("X-First", "1").Set("Content-Type", "text/plain").Set("content-type", "application/json");
    ASSERT_EQ(h.Size(), 2u);
    EXPECT_EQ(h.Entries()[1].name, "Content-Type");
    EXPECT_EQ(h.Get("CONTENT-TYPE").value_or(""), "application/json");
    h.Remove("x-first");
    EXPECT_FALSE(h.Contains("X-First"));
}

TEST(Headers, MergeOtherWins) {
    Headers base = Headers::DefaultJson();
    Headers over;
    over.Set("Accept", "text/csv").Set("X-Trace", "t1");
    base.Merge(over);
    EXPECT_EQ(base.Get("Accept").value_or(""), "text/csv");
    EXPECT_EQ(base.Get("Content-Type").value_or(""), "application/json");
    EXPECT_EQ(base.Get("X-Trace").value_or(""), "t1");
}

TEST(Headers, AuthorizationHelpers) {
    Headers h;
    h.BearerAuth("abc");
    EXPECT_EQ(h.Get(Headers::AUTHORIZATION).value_or(""), "Bearer abc");
    h.BasicAuth("Aladdin", "open sesame");
    EXPECT_EQ(h.Get(Headers::AUTHORIZATION).value_or(""), "Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
    EXPECT_EQ(h.Size(), 1u);
}

TEST(Headers, Base64EncodeHandlesPaddingAndHighBytes) {
    EXPECT_EQ(Headers::Base64Encode(""), "");
    EXPECT_EQ(Headers::Base64Encode("f"), "Zg==");
    EXPECT_EQ(Headers::Base64Encode("fo"), "Zm8=");
    EXPECT_EQ(Headers::Base64Encode("foo"), "Zm9v");
    EXPECT_EQ(Headers::Base64Encode("foob"), "Zm9vYg==");
    EXPECT_EQ(Headers::Base64Encode(std::string("\xff\xfe", 2)), "//4=");
}

TEST(Method, IdempotencyAndNames) {
    EXPECT_TRUE(IsIdempotent(Method::Get));
    EXPECT_TRUE(IsIdempotent(Method::Put));
    EXPECT_TRUE(IsIdempotent(Method::Delete));
    EXPECT_FALSE(IsIdempotent(Method::Post));
    EXPECT_FALSE(IsIdempotent(Method::Patch));
    EXPECT_STREQ(ToString(Method::Delete), "DELETE");
    EXPECT_EQ(MethodFromString("patch"), Method::Patch);
    EXPECT_FALSE(MethodFromString("BREW").has_value());
}

TEST(RequestBuilder, DefaultsToJsonGet) {
    RequestSpec spec = RequestBuilder("/users").Build();
    EXPECT_EQ(spec.GetMethod(), Method::Get);
    EXPECT_EQ(spec.GetEndpoint(), "/users");
    EXPECT_EQ(spec.GetHeaders().Get("Accept").value_or(""), "application/json");
    EXPECT_EQ(spec.GetResponseShape(), ResponseShape::Json);
    EXPECT_FALSE(spec.GetBody().has_value());
    EXPECT_FALSE(spec.GetDeadline().has_value());
    EXPECT_EQ(spec.Describe(), "GET /users");
}

TEST(RequestBuilder, CollectsAllParts) {
    RequestSpec spec = RequestBuilder::Post("/orders")
        .Header("X-Request-Id", "42")
        .Query("page", "2")
        .Body("{\"a\":1}")
        .Shape(ResponseShape::Text)
        .Timeout(std::chrono::seconds(5))
        .Build();
    EXPECT_EQ(spec.GetMethod(), Method::Post);
    EXPECT_EQ(spec.GetHeaders().Get("x-request-id").value_or(""), "42");
    EXPECT_EQ(spec.GetQueryParams().at("page"), "2");
    EXPECT_EQ(spec.GetBody().value_or(""), "{\"a\":1}");
    EXPECT_EQ(spec.GetResponseShape(), ResponseShape::Text);
    ASSERT_TRUE(spec.GetDeadline().has_value());
    EXPECT_FALSE(spec.HasDeadlinePassed());
}

TEST(RequestBuilder, EmptyEndpointIsConfigError) {
    EXPECT_THROW((void)RequestBuilder().Build(), errors::ConfigException);
}

TEST(RequestSpec, WithHelpersCopy) {
    RequestSpec spec = RequestBuilder::Get("/a").Build();
    Headers h;
    h.Set("X-Only", "1");
    RequestSpec other = spec.WithHeaders(h).WithEndpoint("/b");
    EXPECT_EQ(spec.GetEndpoint(), "/a");
    EXPECT_TRUE(spec.GetHeaders().Contains("Accept"));
    EXPECT_EQ(other.GetEndpoint(), "/b");
    EXPECT_EQ(other.GetHeaders().Size(), 1u);
}

TEST(RequestSpec, PastDeadline) {
    RequestSpec spec = RequestBuilder::Get("/a").Deadline(std::chrono::steady_clock::now() - std::chrono::milliseconds(1)).Build();
    EXPECT_TRUE(spec.HasDeadlinePassed());
}

TEST(UrlUtils, ConflictDetection) {
    EXPECT_TRUE(url::IsAbsolute("https://api.example.com/x"));
    EXPECT_FALSE(url::IsAbsolute("/x"));
    EXPECT_TRUE(url::ConflictsWithBaseUrl("http://a/x", "https://b"));
    EXPECT_FALSE(url::ConflictsWithBaseUrl("http://a/x", ""));
    EXPECT_FALSE(url::ConflictsWithBaseUrl("http://a/x", "/"));
    EXPECT_FALSE(url::ConflictsWithBaseUrl("/x", "https://b"));
}

TEST(UrlUtils, JoinUsesSingleSlash) {
    EXPECT_EQ(url::Join("https://api.example.com/", "/users"), "https://api.example.com/users");
    EXPECT_EQ(url::Join("https://api.example.com", "users"), "https://api.example.com/users");
    EXPECT_EQ(url::Join("", "http://other/x"), "http://other/x");
}

TEST(UrlUtils, QueryEncoding) {
    QueryParams q{{"q", "a b&c"}, {"n", "1"}};
    EXPECT_EQ(url::AppendQuery("/search", q), "/search?n=1&q=a+b%26c");
    EXPECT_EQ(url::AppendQuery("/s?x=1", {{"y", "2"}}), "/s?x=1&y=2");
}

TEST(UrlUtils, ParseDefaultsAndErrors) {
    auto p = url::Parse("https://api.example.com/v1/items?id=3");
    EXPECT_EQ(p.scheme, "https");
    EXPECT_EQ(p.host, "api.example.com");
    EXPECT_EQ(p.port, "443");
    EXPECT_EQ(p.target, "/v1/items?id=3");

    auto q = url::Parse("http://127.0.0.1:8080");
    EXPECT_EQ(q.port, "8080");
    EXPECT_EQ(q.target, "/");

    EXPECT_THROW((void)url::Parse("ftp://host/x"), errors::ConfigException);
    EXPECT_THROW((void)url::Parse("http:///x"), errors::ConfigException);
}
