//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for toolbridge (semantic version helpers and client identity).
//==========================================================================================================
#pragma once

#include <string>

#include "toolbridge/Protocol.h"

namespace toolbridge {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the library semantic version components.
//==========================================================================================================
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string formatted as "MAJOR.MINOR.PATCH".
//==========================================================================================================
std::string getVersionString();

//==========================================================================================================
// clientIdentity
// Purpose: The clientInfo announced during initialize: {"toolbridge", getVersionString()}.
//==========================================================================================================
Implementation clientIdentity();

} // namespace toolbridge
