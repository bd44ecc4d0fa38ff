//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/FluentExecutor.hpp
// Purpose: Exception-free execution mode returning Result<Response, ApiError>
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include "rr/Executor.h"
#include "rr/result/ApiError.h"
#include "rr/result/Result.h"

namespace rr {

using ApiResult = Result<Response, ApiError>;

//==========================================================================================================
// FluentExecutor
// Purpose: Converts the delegate's failures into ApiError values. Execute() is a thin bridge that turns a
//          failure value back into a TransportError with the same message, status code and body.
//==========================================================================================================
class FluentExecutor : public IExecutor {
public:
    //==========================================================================================================
    // Constructor
    // Args:
    //   delegate: Fully decorated executor (required).
    //   baseUrl: Base URL the delegate resolves relative endpoints against; used for validation only.
    // Throws:
    //   std::invalid_argument on a null delegate.
    //==========================================================================================================
    FluentExecutor(ExecutorPtr delegate, std::string baseUrl);
    ~FluentExecutor() override;

    //==========================================================================================================
    // ExecuteWithResult
    // Purpose: Executes the request without throwing. An absolute endpoint combined with a base URL is
    //          rejected as ConfigError before the delegate is called.
    // Returns:
    //   Success(Response) or Failure(ApiError).
    //==========================================================================================================
    ApiResult ExecuteWithResult(const RequestSpec& spec);

    // Throwing bridge over ExecuteWithResult().
    Response Execute(const RequestSpec& spec) override;

    void SetBaseUrl(const std::string& baseUrl);
    std::string GetBaseUrl() const;

    //==========================================================================================================
    // Classify
    // Purpose: Maps a failure to ApiError. Precedence: circuit open, 401, other 4xx/5xx, network,
    //          configuration, then HTTP error.
    //==========================================================================================================
    static ApiError Classify(const errors::TransportError& error);

    // Rebuilds the exception form of an ApiError.
    static errors::TransportError ToTransportError(const ApiError& error);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace rr
