//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_executor.cpp
// Purpose: HttpExecutor tests against a local Boost.Beast server (status mapping, headers, network errors)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "rr/HttpExecutor.hpp"
#include "rr/util/ResponseLogger.h"

using namespace rr;

namespace {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// Serves one request per connection on 127.0.0.1 until stopped.
struct MiniServer {
    boost::asio::io_context io;
    tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    unsigned short port{0};

    std::mutex seenMutex;
    http::request<http::string_body> lastRequest;

    static void writeResponse(boost::beast::tcp_stream& stream, unsigned version, http::status status,
                              const std::string& body) {
        http::response<http::string_body> res{status, version};
        res.set(http::field::server, "mini-server");
        res.set(http::field::content_type, "application/json");
        res.set("X-Mini", "1");
        res.keep_alive(false);
        res.body() = body;
        res.prepare_payload();
        boost::system::error_code ec;
        http::write(stream, res, ec);
    }

    void runOnce() {
        boost::system::error_code ec;
        tcp::socket socket{io};
        acceptor.accept(socket, ec);
        if (ec || !running.load()) {
            return;
        }
        boost::beast::tcp_stream stream{std::move(socket)};
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(stream, buffer, req, ec);
        if (ec) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(seenMutex);
            lastRequest = req;
        }

        const std::string target(req.target());
        if (target == "/missing") {
            writeResponse(stream, req.version(), http::status::not_found, "{\"error\":\"nope\"}");
        } else if (target == "/auth") {
            writeResponse(stream, req.version(), http::status::unauthorized, "{\"error\":\"expired\"}");
        } else if (target == "/broken") {
            writeResponse(stream, req.version(), http::status::service_unavailable, "down");
        } else {
            writeResponse(stream, req.version(), http::status::ok, "{\"target\":\"" + target + "\"}");
        }
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    bool start() {
        boost::system::error_code ec;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol(), ec);
        if (!ec) acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec) acceptor.bind(ep, ec);
        if (!ec) acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            return false;
        }
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                runOnce();
            }
        });
        return true;
    }

    void stop() {
        running.store(false);
        boost::system::error_code ec;
        // Unblock accept() with a throwaway connection.
        tcp::socket poke{io};
        poke.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), port}, ec);
        poke.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }

    std::string baseUrl() const {
        return "http://127.0.0.1:" + std::to_string(port);
    }

    http::request<http::string_body> last() {
        std::lock_guard<std::mutex> lk(seenMutex);
        return lastRequest;
    }
};

class HttpExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(server.start());
        ClientOptions opts;
        opts.connectTimeoutMs = 2000;
        opts.readTimeoutMs = 2000;
        exec = std::make_unique<HttpExecutor>(server.baseUrl(), opts);
    }

    void TearDown() override {
        server.stop();
    }

    MiniServer server;
    std::unique_ptr<HttpExecutor> exec;
};

unsigned short unusedPort() {
    boost::asio::io_context io;
    tcp::acceptor a{io, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
    const unsigned short p = a.local_endpoint().port();
    a.close();
    return p;
}

} // namespace

TEST_F(HttpExecutorTest, SuccessReturnsBodyAndHeaders) {
    Response r = exec->Execute(RequestBuilder::Get("/users").Query("q", "a b").Build());
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "{\"target\":\"/users?q=a+b\"}");
    EXPECT_EQ(r.headers.Get("x-mini").value_or(""), "1");

    auto req = server.last();
    EXPECT_EQ(req.method(), http::verb::get);
    EXPECT_EQ(std::string(req[http::field::accept]), "application/json");
    EXPECT_EQ(std::string(req[http::field::user_agent]), "rocketrest");
}

TEST_F(HttpExecutorTest, SendsBodyAndCustomHeaders) {
    exec->Execute(RequestBuilder::Post("/orders").Header("X-Trace", "t-1").Body("{\"qty\":2}").Build());
    auto req = server.last();
    EXPECT_EQ(req.method(), http::verb::post);
    EXPECT_EQ(req.body(), "{\"qty\":2}");
    EXPECT_EQ(std::string(req["X-Trace"]), "t-1");
    EXPECT_EQ(std::string(req[http::field::content_type]), "application/json");
}

TEST_F(HttpExecutorTest, ErrorStatusCarriesBody) {
    try {
        exec->Execute(RequestBuilder::Get("/missing").Build());
        FAIL() << "expected 404";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.StatusCode(), 404);
        EXPECT_EQ(e.Kind(), FailureKind::HttpError);
        EXPECT_STREQ(e.what(), "HTTP request failed with status 404");
        EXPECT_EQ(e.ResponseBody().value_or(""), "{\"error\":\"nope\"}");
    }
    try {
        exec->Execute(RequestBuilder::Get("/broken").Build());
        FAIL() << "expected 503";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.StatusCode(), 503);
    }
}

TEST_F(HttpExecutorTest, UnauthorizedBecomesTokenExpired) {
    try {
        exec->Execute(RequestBuilder::Get("/auth").Build());
        FAIL() << "expected 401";
    } catch (const errors::TokenExpiredException& e) {
        EXPECT_EQ(e.StatusCode(), 401);
        EXPECT_EQ(e.ResponseBody().value_or(""), "{\"error\":\"expired\"}");
    }
}

TEST_F(HttpExecutorTest, NoneShapeDropsBody) {
    Response r = exec->Execute(RequestBuilder::Delete("/orders/1").Shape(ResponseShape::None).Build());
    EXPECT_EQ(r.status, 200);
    EXPECT_TRUE(r.body.empty());
}

TEST_F(HttpExecutorTest, AbsoluteUrlWithBaseIsConfigError) {
    EXPECT_THROW(exec->Execute(RequestBuilder::Get("http://127.0.0.1:1/x").Build()), errors::ConfigException);
    EXPECT_EQ(exec->ResolveUrl(RequestBuilder::Get("/a").Query("k", "v&w").Build()), server.baseUrl() + "/a?k=v%26w");
}

TEST(HttpExecutor, ConnectionRefusedIsNetworkError) {
    ClientOptions opts;
    opts.connectTimeoutMs = 1000;
    HttpExecutor exec("http://127.0.0.1:" + std::to_string(unusedPort()), opts);
    try {
        exec.Execute(RequestBuilder::Get("/x").Build());
        FAIL() << "expected network failure";
    } catch (const errors::NetworkException& e) {
        EXPECT_EQ(e.StatusCode(), 0);
        EXPECT_EQ(e.Kind(), FailureKind::Network);
        EXPECT_EQ(std::string(e.what()).rfind("Network error: ", 0), 0u);
    }
}

TEST(HttpExecutor, AbsoluteUrlWithoutBase) {
    HttpExecutor exec("", ClientOptions{});
    EXPECT_EQ(exec.ResolveUrl(RequestBuilder::Get("https://api.example.com/v1").Build()), "https://api.example.com/v1");
    EXPECT_THROW(exec.Execute(RequestBuilder::Get("/relative-only").Build()), errors::ConfigException);
}

TEST(ResponseLogger, TruncatesLongBodies) {
    EXPECT_EQ(util::TruncateBody("abcdef", 3), std::string("abc") + util::TRUNCATED_MARKER);
    EXPECT_EQ(util::TruncateBody("abc", 3), "abc");
    EXPECT_EQ(util::TruncateBody("", 0), "");
}
