//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read CODEBRIDGE_* environment variables with typed fallbacks.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set or set to an empty string.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return defaultValue;
    }
    return std::string(value);
}

//==========================================================================================================
// GetEnvUInt64OrDefault
// Purpose: Reads an unsigned decimal environment variable.
// Returns:
//   The parsed value, or defaultValue when unset, empty, non-numeric or out of range.
//==========================================================================================================
inline std::uint64_t GetEnvUInt64OrDefault(const char* name, std::uint64_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    for (char c : raw) {
        if (c < '0' || c > '9') {
            return defaultValue;
        }
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(raw));
    } catch (const std::out_of_range&) {
        return defaultValue;
    }
}

// "1", "true", "yes", "on" (any case) are true; "0", "false", "no", "off" are false; anything else is the default.
inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    std::string raw = GetEnvOrDefault(name, "");
    for (auto& c : raw) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    if (raw == "1" || raw == "true" || raw == "yes" || raw == "on") return true;
    if (raw == "0" || raw == "false" || raw == "no" || raw == "off") return false;
    return defaultValue;
}
