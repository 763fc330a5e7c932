//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Opt-in response shape validation mode for sessions (Off by default)
//==========================================================================================================

#pragma once

#include <string>

namespace toolbridge {
namespace validation {

// Validation modes for runtime shape checks of peer responses
enum class ValidationMode {
    Off = 0,
    Strict = 1,
};

inline const char* toString(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::Strict: return "Strict";
        case ValidationMode::Off:
        default: return "Off";
    }
}

inline ValidationMode parseMode(const std::string& s) {
    if (s == "strict" || s == "Strict" || s == "STRICT") return ValidationMode::Strict;
    return ValidationMode::Off;
}

} // namespace validation
} // namespace toolbridge
