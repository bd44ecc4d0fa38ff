//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/rr/Headers.cpp
// Purpose: Header collection helpers and Basic credential encoding (OpenSSL EVP)
//==========================================================================================================

#include "rr/Headers.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include <openssl/evp.h>

namespace rr {

Headers Headers::DefaultJson() {
    Headers h;
    h.Set(CONTENT_TYPE, APPLICATION_JSON);
    h.Set(ACCEPT, APPLICATION_JSON);
    return h;
}

bool Headers::NameEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (::tolower(static_cast<unsigned char>(a[i])) != ::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

Headers& Headers::Set(const std::string& name, const std::string& value) {
    for (auto& kv : entries) {
        if (NameEquals(kv.name, name)) {
            kv.value = value;
            return *this;
        }
    }
    entries.push_back(HeaderKV{name, value});
    return *this;
}

std::optional<std::string> Headers::Get(const std::string& name) const {
    for (const auto& kv : entries) {
        if (NameEquals(kv.name, name)) {
            return kv.value;
        }
    }
    return std::nullopt;
}

bool Headers::Contains(const std::string& name) const {
    return Get(name).has_value();
}

Headers& Headers::Remove(const std::string& name) {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const HeaderKV& kv) { return NameEquals(kv.name, name); }),
                  entries.end());
    return *this;
}

Headers& Headers::Merge(const Headers& other) {
    for (const auto& kv : other.entries) {
        Set(kv.name, kv.value);
    }
    return *this;
}

Headers& Headers::BearerAuth(const std::string& token) {
    return Set(AUTHORIZATION, std::string("Bearer ") + token);
}

Headers& Headers::BasicAuth(const std::string& username, const std::string& password) {
    return Set(AUTHORIZATION, std::string("Basic ") + Base64Encode(username + ":" + password));
}

std::string Headers::Base64Encode(const std::string& raw) {
    if (raw.empty()) {
        return std::string();
    }
    const std::vector<unsigned char> in(raw.begin(), raw.end());
    // EVP_EncodeBlock NUL-terminates its output.
    std::vector<unsigned char> out(4 * ((in.size() + 2) / 3) + 1);
    const int n = ::EVP_EncodeBlock(out.data(), in.data(), static_cast<int>(in.size()));
    if (n <= 0) {
        return std::string();
    }
    return std::string(out.begin(), out.begin() + n);
}

} // namespace rr
