#pragma once

#include "hexregion/HexMetrics.hpp"

#include <cstdint>

namespace hexregion {

enum class TerrainType : std::uint8_t {
  Ocean = 0,
  Coast = 1,
  Plains = 2,
  Forest = 3,
  Hills = 4,
  Mountains = 5,
  Snow = 6,
  Desert = 7,
  Tundra = 8,
  Jungle = 9,
  Savanna = 10,
  Taiga = 11,
};

constexpr int kTerrainTypeCount = 12;

enum class SpecialFeature : std::uint8_t {
  None = 0,
  Castle = 1,
  Ziggurat = 2,
  Megaflora = 3,
};

const char* ToString(TerrainType t);
const char* ToString(SpecialFeature s);

// Maps an arbitrary stored index to a TerrainType. Unknown indices map to Ocean.
TerrainType TerrainFromIndex(int index);

// Feature density levels (urban/farm/plant) are stored in 2 bits each.
constexpr int kMaxFeatureLevel = 3;

// Per-cell terrain state. Plain data: copied freely, compared field by field.
//
// River/road edge directions use HexDirection indices (NE=0 .. NW=5). A river
// direction is only meaningful while its flag is set.
struct CellData {
  std::int16_t x = 0;
  std::int16_t z = 0;

  int elevation = 0;
  int waterLevel = 0;
  int terrainTypeIndex = 0;

  int urbanLevel = 0;
  int farmLevel = 0;
  int plantLevel = 0;
  int specialIndex = 0;
  bool walled = false;

  bool hasIncomingRiver = false;
  bool hasOutgoingRiver = false;
  int incomingRiverDirection = 0;
  int outgoingRiverDirection = 0;

  // Bit d set => road through edge d.
  std::uint8_t roadMask = 0;

  float moisture = 0.0f;

  OffsetCoord coord() const { return OffsetCoord{x, z}; }
  TerrainType terrain() const { return TerrainFromIndex(terrainTypeIndex); }
  SpecialFeature special() const { return static_cast<SpecialFeature>(specialIndex & 0x3); }

  bool isUnderwater() const { return waterLevel > elevation; }
  bool isMegaflora() const { return specialIndex == static_cast<int>(SpecialFeature::Megaflora); }

  bool hasRiver() const { return hasIncomingRiver || hasOutgoingRiver; }
  bool hasRiverBeginOrEnd() const { return hasIncomingRiver != hasOutgoingRiver; }
  bool hasRiverThroughEdge(int dir) const;

  // True when the river enters and leaves through opposite edges.
  bool isRiverStraightThrough() const;

  void setOutgoingRiver(int dir);
  void setIncomingRiver(int dir);
  void removeRiver();

  bool hasRoads() const { return roadMask != 0; }
  bool hasRoadThroughEdge(int dir) const;
  void setRoad(int dir, bool on);
  void clearRoads() { roadMask = 0; }

  // Assigning a special structure removes the cell's roads.
  void setSpecial(SpecialFeature s);

  bool operator==(const CellData& o) const;
  bool operator!=(const CellData& o) const { return !(*this == o); }
};

} // namespace hexregion
