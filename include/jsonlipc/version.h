//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version, reported to the parent in the "ready" notification.
//==========================================================================================================
#pragma once

#include <string>

namespace jsonlipc {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the version formatted as "MAJOR.MINOR.PATCH".
//==========================================================================================================
std::string getVersionString();

} // namespace jsonlipc
