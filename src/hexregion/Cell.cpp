#include "hexregion/Cell.hpp"

namespace hexregion {

const char* ToString(TerrainType t)
{
  switch (t) {
  case TerrainType::Ocean: return "Ocean";
  case TerrainType::Coast: return "Coast";
  case TerrainType::Plains: return "Plains";
  case TerrainType::Forest: return "Forest";
  case TerrainType::Hills: return "Hills";
  case TerrainType::Mountains: return "Mountains";
  case TerrainType::Snow: return "Snow";
  case TerrainType::Desert: return "Desert";
  case TerrainType::Tundra: return "Tundra";
  case TerrainType::Jungle: return "Jungle";
  case TerrainType::Savanna: return "Savanna";
  case TerrainType::Taiga: return "Taiga";
  default: return "Unknown";
  }
}

const char* ToString(SpecialFeature s)
{
  switch (s) {
  case SpecialFeature::None: return "None";
  case SpecialFeature::Castle: return "Castle";
  case SpecialFeature::Ziggurat: return "Ziggurat";
  case SpecialFeature::Megaflora: return "Megaflora";
  default: return "Unknown";
  }
}

TerrainType TerrainFromIndex(int index)
{
  if (index < 0 || index >= kTerrainTypeCount) return TerrainType::Ocean;
  return static_cast<TerrainType>(index);
}

bool CellData::hasRiverThroughEdge(int dir) const
{
  return (hasIncomingRiver && incomingRiverDirection == dir) || (hasOutgoingRiver && outgoingRiverDirection == dir);
}

bool CellData::isRiverStraightThrough() const
{
  if (!hasIncomingRiver || !hasOutgoingRiver) return false;
  return DirectionIndex(Opposite(DirectionFromIndex(incomingRiverDirection))) == outgoingRiverDirection;
}

void CellData::setOutgoingRiver(int dir)
{
  hasOutgoingRiver = true;
  outgoingRiverDirection = DirectionIndex(DirectionFromIndex(dir));
  // Rivers and roads never share an edge.
  setRoad(outgoingRiverDirection, false);
}

void CellData::setIncomingRiver(int dir)
{
  hasIncomingRiver = true;
  incomingRiverDirection = DirectionIndex(DirectionFromIndex(dir));
  setRoad(incomingRiverDirection, false);
}

void CellData::removeRiver()
{
  hasIncomingRiver = false;
  hasOutgoingRiver = false;
  incomingRiverDirection = 0;
  outgoingRiverDirection = 0;
}

bool CellData::hasRoadThroughEdge(int dir) const
{
  if (dir < 0 || dir >= kHexDirectionCount) return false;
  return (roadMask & (1u << dir)) != 0;
}

void CellData::setRoad(int dir, bool on)
{
  if (dir < 0 || dir >= kHexDirectionCount) return;
  const std::uint8_t bit = static_cast<std::uint8_t>(1u << dir);
  if (on) {
    roadMask = static_cast<std::uint8_t>(roadMask | bit);
  } else {
    roadMask = static_cast<std::uint8_t>(roadMask & ~bit);
  }
}

void CellData::setSpecial(SpecialFeature s)
{
  specialIndex = static_cast<int>(s);
  if (s != SpecialFeature::None) clearRoads();
}

bool CellData::operator==(const CellData& o) const
{
  return x == o.x && z == o.z && elevation == o.elevation && waterLevel == o.waterLevel &&
         terrainTypeIndex == o.terrainTypeIndex && urbanLevel == o.urbanLevel && farmLevel == o.farmLevel &&
         plantLevel == o.plantLevel && specialIndex == o.specialIndex && walled == o.walled &&
         hasIncomingRiver == o.hasIncomingRiver && hasOutgoingRiver == o.hasOutgoingRiver &&
         incomingRiverDirection == o.incomingRiverDirection && outgoingRiverDirection == o.outgoingRiverDirection &&
         roadMask == o.roadMask && moisture == o.moisture;
}

} // namespace hexregion
