//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/HttpExecutor.cpp
// Purpose: HTTP/HTTPS base executor using Boost.Beast (one connection per request)
//==========================================================================================================

//==========================================================================================================
#include <algorithm>
#include <chrono>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "rr/HttpConstants.h"
#include "rr/HttpExecutor.hpp"
#include "rr/UrlUtils.h"
#include "rr/util/ResponseLogger.h"

#include <openssl/ssl.h>

namespace rr {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

http::verb toVerb(Method m) {
    switch (m) {
    case Method::Get: return http::verb::get;
    case Method::Post: return http::verb::post;
    case Method::Put: return http::verb::put;
    case Method::Patch: return http::verb::patch;
    case Method::Delete: return http::verb::delete_;
    case Method::Head: return http::verb::head;
    case Method::Options: return http::verb::options;
    }
    return http::verb::get;
}

std::string toString(boost::beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

struct Timeouts {
    std::chrono::milliseconds connect;
    std::chrono::milliseconds read;
};

} // namespace

class HttpExecutor::Impl {
public:
    std::string baseUrl;
    ClientOptions opts;
    ssl::context sslCtx{ssl::context::tls_client};
    bool caInitOk{true};

    Impl(std::string b, ClientOptions o) : baseUrl(std::move(b)), opts(std::move(o)) {
        ::SSL_CTX_set_min_proto_version(sslCtx.native_handle(), TLS1_2_VERSION);
        const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
        if (userProvidedCA) {
            try {
                if (!opts.caFile.empty()) { sslCtx.load_verify_file(opts.caFile); }
                if (!opts.caPath.empty()) { sslCtx.add_verify_path(opts.caPath); }
            } catch (const boost::system::system_error& e) {
                LOG_WARN("HTTPS: failed to load user-provided CA file/path: {}", e.what());
                caInitOk = false;
            }
        } else {
            try {
                sslCtx.set_default_verify_paths();
            } catch (const boost::system::system_error& e) {
                LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
            }
        }
        sslCtx.set_verify_mode(ssl::verify_peer);
    }

    std::string resolveUrl(const RequestSpec& spec) const {
        if (url::ConflictsWithBaseUrl(spec.GetEndpoint(), baseUrl)) {
            throw errors::ConfigException(url::ConflictMessage(spec.GetEndpoint(), baseUrl));
        }
        return url::AppendQuery(url::Join(baseUrl, spec.GetEndpoint()), spec.GetQueryParams());
    }

    // Transport timeouts, clamped to whatever is left of the request deadline.
    Timeouts timeoutsFor(const RequestSpec& spec) const {
        Timeouts t{std::chrono::milliseconds(opts.connectTimeoutMs), std::chrono::milliseconds(opts.readTimeoutMs)};
        if (spec.GetDeadline()) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*spec.GetDeadline() - std::chrono::steady_clock::now());
            left = std::max(left, std::chrono::milliseconds(1));
            t.connect = std::min(t.connect, left);
            t.read = std::min(t.read, left);
        }
        return t;
    }

    http::request<http::string_body> buildRequest(const url::UrlParts& u, const RequestSpec& spec) const {
        http::request<http::string_body> req{toVerb(spec.GetMethod()), u.target, 11};
        const bool defaultPort = (u.scheme == "https" && u.port == "443") || (u.scheme == "http" && u.port == "80");
        req.set(http::field::host, defaultPort ? u.host : u.host + ":" + u.port);
        req.set(http::field::user_agent, "rocketrest");
        for (const auto& h : spec.GetHeaders().Entries()) {
            req.set(h.name, h.value);
        }
        if (spec.GetResponseShape() == ResponseShape::Json && !spec.GetHeaders().Contains(Headers::ACCEPT)) {
            req.set(http::field::accept, Headers::APPLICATION_JSON);
        }
        req.set(http::field::connection, "close");
        if (spec.GetBody()) {
            req.body() = *spec.GetBody();
        }
        req.prepare_payload();
        return req;
    }

    // Coroutine: write the request and read one response on an already connected stream
    template <typename Stream>
    net::awaitable<Response> coExchange(Stream& stream, boost::beast::tcp_stream& lowest,
                                        http::request<http::string_body>& req, bool head,
                                        std::chrono::milliseconds readTimeout) {
        lowest.expires_after(readTimeout);
        co_await http::async_write(stream, req, net::use_awaitable);

        boost::beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.skip(head);
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);
        http::response<http::string_body> res = parser.release();

        Response out;
        out.status = static_cast<int>(res.result_int());
        for (const auto& field : res) {
            out.headers.Set(toString(field.name_string()), toString(field.value()));
        }
        out.body = std::move(res.body());
        co_return out;
    }

    // Coroutine: resolve, connect, exchange and close
    net::awaitable<Response> coExecute(url::UrlParts u, http::request<http::string_body> req, bool head, Timeouts t) {
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);

        if (u.scheme == "https") {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                LOG_WARN("HTTPS: failed to set SNI hostname {}", u.host);
            }
            if (::SSL_set1_host(stream.native_handle(), u.host.c_str()) != 1) {
                LOG_WARN("HTTPS: failed to enable hostname verification for {}", u.host);
            }
            stream.next_layer().expires_after(t.connect);
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            Response out = co_await coExchange(stream, stream.next_layer(), req, head, t.read);
            boost::system::error_code ec;
            stream.shutdown(ec);
            if (ec) {
                LOG_DEBUG("HTTPS: shutdown reported {}", ec.message());
            }
            co_return out;
        }

        boost::beast::tcp_stream stream(co_await net::this_coro::executor);
        stream.expires_after(t.connect);
        co_await stream.async_connect(results, net::use_awaitable);

        Response out = co_await coExchange(stream, stream, req, head, t.read);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec) {
            LOG_DEBUG("HTTP: shutdown reported {}", ec.message());
        }
        co_return out;
    }
};

HttpExecutor::HttpExecutor(std::string baseUrl, ClientOptions options)
    : pImpl(std::make_unique<Impl>(std::move(baseUrl), std::move(options))) {}

HttpExecutor::~HttpExecutor() = default;

std::string HttpExecutor::ResolveUrl(const RequestSpec& spec) const {
    return pImpl->resolveUrl(spec);
}

Response HttpExecutor::Execute(const RequestSpec& spec) {
    FUNC_SCOPE();
    const std::string fullUrl = pImpl->resolveUrl(spec);
    const url::UrlParts parts = url::Parse(fullUrl);
    if (parts.scheme == "https" && !pImpl->caInitOk) {
        throw errors::ConfigException("HTTPS: failed to load user-provided CA file/path");
    }
    LOG_DEBUG("HTTP {} {}", ToString(spec.GetMethod()), fullUrl);

    const bool head = spec.GetMethod() == Method::Head;
    net::io_context ioc;
    std::exception_ptr failure;
    Response res;
    net::co_spawn(ioc, pImpl->coExecute(parts, pImpl->buildRequest(parts, spec), head, pImpl->timeoutsFor(spec)),
        [&failure, &res](std::exception_ptr eptr, Response out) {
            failure = eptr;
            res = std::move(out);
        });
    ioc.run();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("HTTP {} {} failed: {}", ToString(spec.GetMethod()), fullUrl, e.what());
            throw errors::NetworkException(std::string("Network error: ") + e.what(), std::current_exception());
        } catch (const TransportError&) {
            throw;
        } catch (const std::exception& e) {
            throw errors::NetworkException(std::string("Network error: ") + e.what(), std::current_exception());
        }
    }

    util::LogRawResponse(res.status, res.headers, pImpl->opts);
    util::LogResponseBody(res.body, pImpl->opts);

    if (res.status == http_status::UNAUTHORIZED) {
        throw errors::TokenExpiredException(messages::TOKEN_EXPIRED, res.body);
    }
    if (!http_status::IsSuccess(res.status)) {
        throw TransportError(messages::HTTP_FAILED_PREFIX + std::to_string(res.status), res.status, res.body,
                             FailureKind::HttpError);
    }
    if (spec.GetResponseShape() == ResponseShape::None) {
        res.body.clear();
    }
    return res;
}

} // namespace rr
