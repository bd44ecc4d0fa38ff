//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/rr/Headers.hpp
// Purpose: Insertion-ordered, case-insensitive HTTP header collection
//==========================================================================================================
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace rr {

struct HeaderKV {
    std::string name;
    std::string value;
};

//==========================================================================================================
// Headers
// Purpose: Ordered list of header name/value pairs. Lookups ignore case; Set() replaces the first entry
//          with a matching name in place so the original position is kept.
//==========================================================================================================
class Headers {
public:
    static constexpr const char* CONTENT_TYPE = "Content-Type";
    static constexpr const char* ACCEPT = "Accept";
    static constexpr const char* AUTHORIZATION = "Authorization";
    static constexpr const char* APPLICATION_JSON = "application/json";

    Headers() = default;

    //==========================================================================================================
    // DefaultJson
    // Purpose: Returns headers with Content-Type and Accept set to application/json.
    //==========================================================================================================
    static Headers DefaultJson();

    Headers& Set(const std::string& name, const std::string& value);
    std::optional<std::string> Get(const std::string& name) const;
    bool Contains(const std::string& name) const;
    Headers& Remove(const std::string& name);

    //==========================================================================================================
    // Merge
    // Purpose: Copies every entry of other into this collection; other wins on name collisions.
    //==========================================================================================================
    Headers& Merge(const Headers& other);

    Headers& ContentType(const std::string& value) { return Set(CONTENT_TYPE, value); }
    Headers& Accept(const std::string& value) { return Set(ACCEPT, value); }
    Headers& BearerAuth(const std::string& token);
    Headers& BasicAuth(const std::string& username, const std::string& password);

    const std::vector<HeaderKV>& Entries() const { return entries; }
    std::size_t Size() const { return entries.size(); }
    bool Empty() const { return entries.empty(); }

    static bool NameEquals(const std::string& a, const std::string& b);

    //==========================================================================================================
    // Base64Encode
    // Purpose: Standard (padded) Base64 of raw bytes, used for Basic credentials.
    //==========================================================================================================
    static std::string Base64Encode(const std::string& raw);

private:
    std::vector<HeaderKV> entries;
};

} // namespace rr
