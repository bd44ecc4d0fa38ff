//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseLogger.cpp
// Purpose: Debug logging of raw responses and (truncated) response bodies
//==========================================================================================================

#include "rr/util/ResponseLogger.h"

#include "logging/Logger.h"

namespace rr {
namespace util {

void LogRawResponse(int status, const Headers& headers, const ClientOptions& options) {
    if (!options.logRawResponse) {
        return;
    }
    LOG_DEBUG("Response status: {}", status);
    for (const auto& h : headers.Entries()) {
        LOG_DEBUG("Response header: {}: {}", h.name, h.value);
    }
}

void LogResponseBody(const std::string& body, const ClientOptions& options) {
    if (!options.logResponseBody || body.empty()) {
        return;
    }
    LOG_DEBUG("Response body: {}", TruncateBody(body, options.maxLoggedBodyLength));
}

std::string TruncateBody(const std::string& body, std::size_t maxLength) {
    if (body.size() <= maxLength) {
        return body;
    }
    return body.substr(0, maxLength) + TRUNCATED_MARKER;
}

} // namespace util
} // namespace rr
