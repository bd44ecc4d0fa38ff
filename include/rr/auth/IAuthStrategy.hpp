//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/auth/IAuthStrategy.hpp
// Purpose: Authentication contract consumed by the request orchestrator
//==========================================================================================================
#pragma once

#include <memory>

#include "rr/Headers.hpp"

namespace rr::auth {

enum class AuthType {
    None,
    Bearer,
    Basic,
    Custom
};

class IAuthStrategy {
public:
    virtual ~IAuthStrategy() = default;

    virtual AuthType type() const = 0;

    // Returns headers with the strategy's credentials applied.
    virtual Headers applyHeaders(Headers headers) const = 0;

    // True when credentials should be refreshed before the next request.
    virtual bool needsRefresh() const = 0;

    // Refreshes credentials. Must tolerate concurrent callers: returns false rather than starting a second
    // refresh while one is in flight.
    virtual bool refresh() = 0;
};

using AuthStrategyPtr = std::shared_ptr<IAuthStrategy>;

} // namespace rr::auth
