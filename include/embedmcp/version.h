//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version reported in serverInfo and logs.
//==========================================================================================================
#pragma once

#include <string>

#include "embedmcp/Protocol.h"

namespace embedmcp {

// "major.minor.patch" of the library build, taken from the project version.
std::string getVersionString();

//==========================================================================================================
// MakeServerInfo
// Purpose: serverInfo for initialize and the connection handshake, stamped with the library version.
// Args:
//   name: Application-chosen server name.
//==========================================================================================================
Implementation MakeServerInfo(const std::string& name);

} // namespace embedmcp
