#include "hexregion/Version.hpp"

#include "hexregion/RegionSerializer.hpp"

namespace hexregion {

std::string HexRegionFullVersionString()
{
  return std::string(HexRegionVersionString()) + " (region format v" + std::to_string(kRegionFileVersion) + ")";
}

} // namespace hexregion
