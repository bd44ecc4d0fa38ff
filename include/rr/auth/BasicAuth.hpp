//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/auth/BasicAuth.hpp
// Purpose: No-op and HTTP Basic authentication strategies
//==========================================================================================================
#pragma once

#include <string>
#include <utility>

#include "rr/auth/IAuthStrategy.hpp"

namespace rr::auth {

class NoAuth final : public IAuthStrategy {
public:
    AuthType type() const override { return AuthType::None; }
    Headers applyHeaders(Headers headers) const override { return headers; }
    bool needsRefresh() const override { return false; }
    bool refresh() override { return true; }
};

class BasicAuth final : public IAuthStrategy {
public:
    BasicAuth(std::string username, std::string password)
        : username(std::move(username)), password(std::move(password)) {}

    AuthType type() const override { return AuthType::Basic; }

    Headers applyHeaders(Headers headers) const override {
        headers.BasicAuth(username, password);
        return headers;
    }

    bool needsRefresh() const override { return false; }

    // Static credentials; nothing to refresh.
    bool refresh() override { return true; }

private:
    std::string username;
    std::string password;
};

} // namespace rr::auth
