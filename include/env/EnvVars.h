//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely, with typed fallbacks for numeric and flag values.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
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
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvUInt64OrDefault
// Purpose: Reads an unsigned integer environment variable.
// Args:
//   name: Environment variable name.
//   defaultValue: Value used when the variable is unset or malformed.
// Returns:
//   Parsed value or defaultValue. Malformed values are reported on stderr (the logger may not be
//   configured yet when settings are read).
//==========================================================================================================
inline uint64_t GetEnvUInt64OrDefault(const char* name, uint64_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(raw, &used);
        if (used != raw.size() || raw.front() == '-') {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        std::cerr << "[WARN] Ignoring malformed value for " << name << ": '" << raw << "'" << std::endl;
        return defaultValue;
    }
}

//==========================================================================================================
// GetEnvBoolOrDefault
// Purpose: Reads a flag environment variable ("1", "true", "yes", "on" are true; "0", "false", "no",
//          "off" are false; anything else keeps the default).
//==========================================================================================================
inline bool GetEnvBoolOrDefault(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "FALSE" || v == "no" || v == "off") return false;
    return defaultValue;
}
