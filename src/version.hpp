#pragma once

// Build/version info.
//
// CMake defines TOMBCRAWL_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef TOMBCRAWL_VERSION
#define TOMBCRAWL_VERSION "dev"
#endif

#ifndef TOMBCRAWL_APPNAME
#define TOMBCRAWL_APPNAME "TombCrawl"
#endif
