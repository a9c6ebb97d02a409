//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version, advertised as clientInfo.version during the initialize handshake.
//==========================================================================================================
#pragma once

#include <string>

namespace mcpleague {

//==========================================================================================================
// VersionInfo
// Fields:
//   major, minor, patch: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

} // namespace mcpleague
