#include "hexregion/GridBridge.hpp"

#include "hexregion/Random.hpp"

#include <utility>

namespace hexregion {

void RegionGrid::setCellProperties(int x, int z, const CellData& props)
{
  CellData* c = m_region.tryGet(x, z);
  if (!c) return;
  c->elevation = props.elevation;
  c->waterLevel = props.waterLevel;
  c->terrainTypeIndex = props.terrainTypeIndex;
  c->urbanLevel = props.urbanLevel;
  c->farmLevel = props.farmLevel;
  c->plantLevel = props.plantLevel;
  c->walled = props.walled;
  c->moisture = props.moisture;
  c->setSpecial(props.special());
}

void RegionGrid::clearRiversAndRoads(int x, int z)
{
  CellData* c = m_region.tryGet(x, z);
  if (!c) return;
  c->removeRiver();
  c->clearRoads();
}

void RegionGrid::setOutgoingRiver(int x, int z, HexDirection dir)
{
  CellData* c = m_region.tryGet(x, z);
  if (!c) return;
  const int n = m_region.neighborIndex(m_region.indexOf(x, z), dir);
  if (n < 0) return;
  c->setOutgoingRiver(DirectionIndex(dir));
  CellData& next = m_region.at(n);
  if (!next.hasIncomingRiver) next.setIncomingRiver(DirectionIndex(Opposite(dir)));
}

void RegionGrid::addRoad(int x, int z, HexDirection dir)
{
  CellData* c = m_region.tryGet(x, z);
  if (!c) return;
  const int n = m_region.neighborIndex(m_region.indexOf(x, z), dir);
  if (n < 0) return;
  c->setRoad(DirectionIndex(dir), true);
  m_region.at(n).setRoad(DirectionIndex(Opposite(dir)), true);
}

bool ApplyRegionToGrid(const RegionData& region, HexGridAccess& grid, std::string& outError)
{
  outError.clear();
  if (grid.width() != region.width() || grid.height() != region.height()) {
    outError = "Grid is " + std::to_string(grid.width()) + "x" + std::to_string(grid.height()) + ", region is " +
               std::to_string(region.width()) + "x" + std::to_string(region.height());
    return false;
  }

  const int w = region.width();
  const int h = region.height();

  for (int z = 0; z < h; ++z) {
    for (int x = 0; x < w; ++x) {
      grid.clearRiversAndRoads(x, z);
      grid.setCellProperties(x, z, region.at(x, z));
    }
  }

  for (int z = 0; z < h; ++z) {
    for (int x = 0; x < w; ++x) {
      const CellData& c = region.at(x, z);
      if (c.hasOutgoingRiver) grid.setOutgoingRiver(x, z, DirectionFromIndex(c.outgoingRiverDirection));
    }
  }

  for (int z = 0; z < h; ++z) {
    for (int x = 0; x < w; ++x) {
      const CellData& c = region.at(x, z);
      for (int d = 0; d < kHexDirectionCount; ++d) {
        if (c.hasRoadThroughEdge(d)) grid.addRoad(x, z, static_cast<HexDirection>(d));
      }
    }
  }
  return true;
}

bool ExtractRegionFromGrid(const HexGridAccess& grid, const std::string& name, std::int32_t seed, RegionData& outRegion,
                           std::string& outError)
{
  outError.clear();
  const int w = grid.width();
  const int h = grid.height();
  if (w <= 0 || h <= 0) {
    outError = "Grid is empty";
    return false;
  }

  RegionData region;
  region.reset(w, h);
  for (int z = 0; z < h; ++z) {
    for (int x = 0; x < w; ++x) {
      const CellData* src = grid.cell(x, z);
      if (!src) {
        outError = "Grid cell " + std::to_string(x) + "," + std::to_string(z) + " is missing";
        return false;
      }
      CellData& dst = region.at(x, z);
      dst = *src;
      dst.x = static_cast<std::int16_t>(x);
      dst.z = static_cast<std::int16_t>(z);
    }
  }

  region.name = name;
  region.seed = seed;
  region.id = RegionId::Generate(TimeSeed());
  region.generatedAtTicks = NowTicks();
  outRegion = std::move(region);
  return true;
}

} // namespace hexregion
