//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseLogger.h
// Purpose: Debug logging of raw responses and (truncated) response bodies
//==========================================================================================================
#pragma once

#include <string>

#include "rr/ClientOptions.hpp"
#include "rr/Headers.hpp"

namespace rr {
namespace util {

constexpr const char* TRUNCATED_MARKER = "... (truncated)";

// Logs status and headers at DEBUG when options.logRawResponse is set.
void LogRawResponse(int status, const Headers& headers, const ClientOptions& options);

// Logs the body at DEBUG when options.logResponseBody is set.
void LogResponseBody(const std::string& body, const ClientOptions& options);

// Cuts the body to maxLength characters and appends TRUNCATED_MARKER when it was longer.
std::string TruncateBody(const std::string& body, std::size_t maxLength);

} // namespace util
} // namespace rr
