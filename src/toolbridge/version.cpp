//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers and the client identity announced to tool servers.
//==========================================================================================================
#include "toolbridge/version.h"

#include <sstream>

namespace toolbridge {

VersionInfo getVersion() {
    auto v = VersionInfo{0, 1, 0};
    return v;
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

Implementation clientIdentity() {
    return Implementation{"toolbridge", getVersionString()};
}

} // namespace toolbridge
