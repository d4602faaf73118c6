#pragma once

// Build/version info.
//
// CMake defines CARDFRP_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef CARDFRP_VERSION
#define CARDFRP_VERSION "dev"
#endif

#ifndef CARDFRP_APPNAME
#define CARDFRP_APPNAME "CardFRP"
#endif
