//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UrlUtils.cpp
// Purpose: URL helpers (small parser adequate for http(s)://host[:port]/path?query)
//==========================================================================================================

#include "rr/UrlUtils.h"

#include <sstream>

#include "rr/errors/Errors.h"

namespace rr {
namespace url {

namespace {
std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}
} // namespace

bool IsAbsolute(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

bool HasEffectiveBase(const std::string& baseUrl) {
    const std::string t = trim(baseUrl);
    return !t.empty() && t != "/";
}

bool ConflictsWithBaseUrl(const std::string& endpoint, const std::string& baseUrl) {
    return IsAbsolute(endpoint) && HasEffectiveBase(baseUrl);
}

std::string ConflictMessage(const std::string& endpoint, const std::string& baseUrl) {
    return "Cannot use absolute URL '" + endpoint + "' with base URL '" + baseUrl +
           "'. Either use a relative path or set base URL to empty string.";
}

std::string Join(const std::string& baseUrl, const std::string& endpoint) {
    if (IsAbsolute(endpoint) || !HasEffectiveBase(baseUrl)) {
        return endpoint;
    }
    std::string base = trim(baseUrl);
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (endpoint.empty()) {
        return base;
    }
    if (endpoint.front() == '/') {
        return base + endpoint;
    }
    return base + "/" + endpoint;
}

std::string EncodeComponent(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            const char* hex = "0123456789ABCDEF";
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string AppendQuery(const std::string& url, const QueryParams& params) {
    if (params.empty()) {
        return url;
    }
    std::string out = url;
    char sep = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& kv : params) {
        out += sep;
        out += EncodeComponent(kv.first);
        out += '=';
        out += EncodeComponent(kv.second);
        sep = '&';
    }
    return out;
}

UrlParts Parse(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;

    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = "http";
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw errors::ConfigException("Unsupported URL scheme '" + parts.scheme + "' in " + url);
    }

    std::size_t slash = url.find_first_of("/?", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.target = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.target = url.substr(slash);
        if (parts.target.front() == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = parts.scheme == "https" ? "443" : "80";
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    if (parts.host.empty()) {
        throw errors::ConfigException("URL has no host: " + url);
    }
    return parts;
}

} // namespace url
} // namespace rr
