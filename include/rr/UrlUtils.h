//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UrlUtils.h
// Purpose: URL parsing, joining and query encoding helpers shared by the transport and fluent executor
//==========================================================================================================
#pragma once

#include <string>

#include "rr/RequestSpec.h"

namespace rr {
namespace url {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target; // path plus query, always starting with '/'
};

bool IsAbsolute(const std::string& url);

// True when the base URL is neither blank nor "/".
bool HasEffectiveBase(const std::string& baseUrl);

// An absolute endpoint cannot be combined with an effective base URL.
bool ConflictsWithBaseUrl(const std::string& endpoint, const std::string& baseUrl);
std::string ConflictMessage(const std::string& endpoint, const std::string& baseUrl);

// Joins base and relative endpoint with exactly one '/'. Absolute endpoints are returned unchanged.
std::string Join(const std::string& baseUrl, const std::string& endpoint);

// application/x-www-form-urlencoded encoding of one component.
std::string EncodeComponent(const std::string& s);

// Appends "?k=v&k2=v2" (or "&..." when a query is already present).
std::string AppendQuery(const std::string& url, const QueryParams& params);

//==========================================================================================================
// Parse
// Purpose: Splits scheme://host[:port]/path?query. Scheme defaults to http; ports default to 80/443.
// Throws:
//   errors::ConfigException when the host is empty or the scheme is not http/https.
//==========================================================================================================
UrlParts Parse(const std::string& url);

} // namespace url
} // namespace rr
