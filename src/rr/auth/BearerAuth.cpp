//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/auth/BearerAuth.cpp
// Purpose: Bearer token cache and single-flight refresh
//==========================================================================================================

#include "rr/auth/BearerAuth.hpp"

#include <utility>

#include "logging/Logger.h"

namespace rr::auth {

BearerAuth::BearerAuth(std::string token, RefreshFn fn, std::chrono::seconds skew)
    : current{std::move(token), std::nullopt}, refreshFn(std::move(fn)), refreshSkew(skew) {}

Headers BearerAuth::applyHeaders(Headers headers) const {
    std::lock_guard<std::mutex> lk(mtx);
    if (!current.value.empty()) {
        headers.BearerAuth(current.value);
    }
    return headers;
}

bool BearerAuth::needsRefresh() const {
    std::lock_guard<std::mutex> lk(mtx);
    if (!refreshFn || !current.expiresAt) {
        return false;
    }
    return std::chrono::steady_clock::now() + refreshSkew >= *current.expiresAt;
}

bool BearerAuth::refresh() {
    if (!refreshFn) {
        return false;
    }
    bool expected = false;
    if (!refreshing.compare_exchange_strong(expected, true)) {
        LOG_DEBUG("Bearer token refresh already in progress");
        return false;
    }
    struct Release {
        std::atomic<bool>& flag;
        ~Release() { flag.store(false); }
    } release{refreshing};

    std::optional<Token> fresh = refreshFn();
    if (!fresh || fresh->value.empty()) {
        LOG_WARN("Bearer token refresh returned no token");
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx);
    current = std::move(*fresh);
    LOG_DEBUG("Bearer token refreshed");
    return true;
}

void BearerAuth::setToken(std::string value, std::optional<std::chrono::steady_clock::time_point> expiresAt) {
    std::lock_guard<std::mutex> lk(mtx);
    current.value = std::move(value);
    current.expiresAt = expiresAt;
}

std::string BearerAuth::token() const {
    std::lock_guard<std::mutex> lk(mtx);
    return current.value;
}

} // namespace rr::auth
