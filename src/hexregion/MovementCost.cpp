#include "hexregion/MovementCost.hpp"

#include "hexregion/HexMetrics.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace hexregion {

const char* ToString(UnitType u)
{
  switch (u) {
  case UnitType::Land: return "land";
  case UnitType::Naval: return "naval";
  case UnitType::Amphibious: return "amphibious";
  default: return "unknown";
  }
}

bool ParseUnitType(const std::string& s, UnitType& out)
{
  std::string k = s;
  for (char& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (k == "land") {
    out = UnitType::Land;
    return true;
  }
  if (k == "naval" || k == "ship" || k == "sea") {
    out = UnitType::Naval;
    return true;
  }
  if (k == "amphibious" || k == "amph") {
    out = UnitType::Amphibious;
    return true;
  }
  return false;
}

bool IsWaterForMovement(const CellData& c)
{
  const TerrainType t = c.terrain();
  return c.isUnderwater() || t == TerrainType::Ocean || t == TerrainType::Coast;
}

float LandTerrainCost(TerrainType t)
{
  switch (t) {
  case TerrainType::Plains:
  case TerrainType::Desert:
  case TerrainType::Savanna: return 1.0f;
  case TerrainType::Forest:
  case TerrainType::Taiga:
  case TerrainType::Tundra: return 1.5f;
  case TerrainType::Jungle:
  case TerrainType::Hills: return 2.0f;
  case TerrainType::Snow: return 2.5f;
  case TerrainType::Mountains:
  case TerrainType::Ocean:
  case TerrainType::Coast: return kImpassable;
  default: return kImpassable;
  }
}

float NavalTerrainCost(TerrainType t)
{
  switch (t) {
  case TerrainType::Ocean: return 1.0f;
  case TerrainType::Coast: return 1.5f;
  default: return kImpassable;
  }
}

float LandMovementCost(const CellData& from, const CellData& to)
{
  const float base = LandTerrainCost(to.terrain());
  if (std::isinf(base)) return kImpassable;
  if (to.isUnderwater()) return kImpassable;

  const int diff = to.elevation - from.elevation;
  if (std::abs(diff) >= kMaxClimbStep) return kImpassable;

  float cost = base;
  if (diff > 0) cost += kUphillPenaltyPerLevel * static_cast<float>(diff);
  return cost;
}

float NavalMovementCost(const CellData& /*from*/, const CellData& to)
{
  if (!IsWaterForMovement(to)) return kImpassable;
  const float c = NavalTerrainCost(to.terrain());
  // Submerged cells tagged with a land biome still float a ship.
  return std::isinf(c) ? 1.0f : c;
}

float AmphibiousMovementCost(const CellData& from, const CellData& to)
{
  const float cost = std::min(LandMovementCost(from, to), NavalMovementCost(from, to));
  if (std::isinf(cost)) return kImpassable;

  const bool fromWater = from.isUnderwater();
  const bool toWater = to.isUnderwater();
  return (fromWater != toWater) ? (cost + kEmbarkCost) : cost;
}

float GetMovementCost(UnitType unit, const CellData& from, const CellData& to)
{
  switch (unit) {
  case UnitType::Land: return LandMovementCost(from, to);
  case UnitType::Naval: return NavalMovementCost(from, to);
  case UnitType::Amphibious: return AmphibiousMovementCost(from, to);
  default: return kImpassable;
  }
}

bool IsPassable(UnitType unit, const CellData& c)
{
  const bool land = !std::isinf(LandTerrainCost(c.terrain())) && !c.isUnderwater();
  const bool water = IsWaterForMovement(c);
  switch (unit) {
  case UnitType::Land: return land;
  case UnitType::Naval: return water;
  case UnitType::Amphibious: return land || water;
  default: return false;
  }
}

} // namespace hexregion
