#pragma once

#include <string>

// Build/version metadata for HexRegion.
//
// CMake defines these macros for every target through hexregion_core's PUBLIC
// compile definitions. The fallbacks keep the header usable in IDEs and
// non-CMake builds.

#ifndef HEXREGION_VERSION_MAJOR
#define HEXREGION_VERSION_MAJOR 0
#endif

#ifndef HEXREGION_VERSION_MINOR
#define HEXREGION_VERSION_MINOR 0
#endif

#ifndef HEXREGION_VERSION_PATCH
#define HEXREGION_VERSION_PATCH 0
#endif

#ifndef HEXREGION_VERSION_STRING
#define HEXREGION_VERSION_STRING "0.0.0"
#endif

namespace hexregion {

struct HexRegionVersion {
  int major;
  int minor;
  int patch;
};

inline constexpr HexRegionVersion HexRegionVersionNumbers()
{
  return HexRegionVersion{HEXREGION_VERSION_MAJOR, HEXREGION_VERSION_MINOR, HEXREGION_VERSION_PATCH};
}

inline constexpr const char* HexRegionVersionString()
{
  return HEXREGION_VERSION_STRING;
}

// Version plus the region file format it writes, e.g. "1.2.0 (region format v1)".
std::string HexRegionFullVersionString();

} // namespace hexregion
