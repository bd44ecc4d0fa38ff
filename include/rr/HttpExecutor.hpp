//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/HttpExecutor.hpp
// Purpose: HTTP/HTTPS base executor using Boost.Beast (one connection per request)
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include "rr/ClientOptions.hpp"
#include "rr/Executor.h"

namespace rr {

//==========================================================================================================
// HttpExecutor
// Purpose: Innermost executor of a client. Each Execute() runs one Boost.Asio coroutine on a private
//          io_context: resolve, connect (and TLS handshake for https), write, read, close.
// Notes:
//   - 2xx returns the Response; 401 throws errors::TokenExpiredException; any other status throws
//     TransportError with the status and body.
//   - Resolve, connect, TLS, read and timeout failures throw errors::NetworkException.
//   - An absolute endpoint combined with a base URL, or an unparseable URL, throws errors::ConfigException
//     before any I/O.
//==========================================================================================================
class HttpExecutor : public IExecutor {
public:
    //==========================================================================================================
    // Constructor
    // Args:
    //   baseUrl: Prefix for relative endpoints (may be empty).
    //   options: Timeouts, CA settings and response logging toggles.
    //==========================================================================================================
    HttpExecutor(std::string baseUrl, ClientOptions options);
    ~HttpExecutor() override;

    Response Execute(const RequestSpec& spec) override;

    // Full URL the request would be sent to (base, endpoint and encoded query).
    std::string ResolveUrl(const RequestSpec& spec) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rr
