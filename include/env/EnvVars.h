//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read RR_* environment variables as strings, booleans and integers.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>
#include <optional>
#include <stdexcept>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvBoolOrDefault
// Purpose: Interprets "1", "true", "TRUE", "yes" as true and "0", "false", "FALSE", "no" as false.
// Returns:
//   The parsed flag, or defaultValue when unset or unrecognised.
//==========================================================================================================
inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "FALSE" || v == "no") return false;
    return defaultValue;
}

//==========================================================================================================
// GetEnvInt
// Purpose: Reads an integer environment variable.
// Returns:
//   The value, or std::nullopt when unset or not a whole number.
//==========================================================================================================
inline std::optional<long long> GetEnvInt(const char* name) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        long long n = std::stoll(v, &pos);
        if (pos != v.size()) return std::nullopt;
        return n;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
