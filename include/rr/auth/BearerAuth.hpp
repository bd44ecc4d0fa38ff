//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/auth/BearerAuth.hpp
// Purpose: Bearer token strategy with an optional caller-supplied refresh callback
//==========================================================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "rr/auth/IAuthStrategy.hpp"

namespace rr::auth {

//==========================================================================================================
// BearerAuth
// Purpose: Adds "Authorization: Bearer <token>". The token is replaced by refresh(), which calls the
//          refresh callback; only one refresh runs at a time and concurrent callers get false.
// Notes:
//   - When an expiry is set, needsRefresh() turns true refreshSkew before it.
//==========================================================================================================
class BearerAuth final : public IAuthStrategy {
public:
    struct Token {
        std::string value;
        std::optional<std::chrono::steady_clock::time_point> expiresAt;
    };

    // Returns the new token, or std::nullopt when refresh failed.
    using RefreshFn = std::function<std::optional<Token>()>;

    explicit BearerAuth(std::string token, RefreshFn refreshFn = nullptr,
                        std::chrono::seconds refreshSkew = std::chrono::seconds(60));

    AuthType type() const override { return AuthType::Bearer; }
    Headers applyHeaders(Headers headers) const override;
    bool needsRefresh() const override;
    bool refresh() override;

    void setToken(std::string value, std::optional<std::chrono::steady_clock::time_point> expiresAt = std::nullopt);
    std::string token() const;

private:
    mutable std::mutex mtx;
    Token current;
    RefreshFn refreshFn;
    std::chrono::seconds refreshSkew;
    std::atomic<bool> refreshing{false};
};

} // namespace rr::auth
