//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version (semantic version helpers)
//==========================================================================================================
#pragma once

#include <string>

namespace toolrpc {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"; also the default serverInfo.version.
std::string getVersionString();

} // namespace toolrpc
