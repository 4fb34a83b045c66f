//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Library version reported in serverInfo and logs.
//==========================================================================================================
#include "embedmcp/version.h"

#ifndef EMBEDMCP_VERSION_STRING
#error "EMBEDMCP_VERSION_STRING must be defined by the build"
#endif

namespace embedmcp {

std::string getVersionString() {
    return EMBEDMCP_VERSION_STRING;
}

Implementation MakeServerInfo(const std::string& name) {
    return Implementation(name, getVersionString());
}

} // namespace embedmcp
