//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Response.h
// Purpose: Successful outcome of a request execution
//==========================================================================================================
#pragma once

#include <string>

#include "rr/Headers.hpp"
#include "rr/HttpConstants.h"

namespace rr {

struct Response {
    int status{http_status::OK};
    Headers headers;
    std::string body;

    bool IsSuccess() const { return http_status::IsSuccess(status); }
};

} // namespace rr
