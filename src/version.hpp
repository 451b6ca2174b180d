#pragma once

// Build/version info.
//
// CMake defines HEXWORLD_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef HEXWORLD_VERSION
#define HEXWORLD_VERSION "dev"
#endif

#ifndef HEXWORLD_APPNAME
#define HEXWORLD_APPNAME "HexWorld"
#endif
