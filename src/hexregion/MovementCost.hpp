#pragma once

#include "hexregion/Cell.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace hexregion {

constexpr float kImpassable = std::numeric_limits<float>::infinity();

// Extra cost for moving between water and land (amphibious units only).
constexpr float kEmbarkCost = 1.0f;

// Land units refuse any step with |elevation difference| >= this.
constexpr int kMaxClimbStep = 2;

constexpr float kUphillPenaltyPerLevel = 0.5f;

enum class UnitType : std::uint8_t {
  Land = 0,
  Naval,
  Amphibious,
};

const char* ToString(UnitType u);
bool ParseUnitType(const std::string& s, UnitType& out);

// Water for movement purposes: underwater, or tagged as ocean/coast.
bool IsWaterForMovement(const CellData& c);

// Per-terrain base cost (kImpassable for terrain the unit cannot enter).
float LandTerrainCost(TerrainType t);
float NavalTerrainCost(TerrainType t);

// Cost of stepping from one cell onto an adjacent one. kImpassable means the
// step is forbidden. Adjacency is the caller's responsibility.
float LandMovementCost(const CellData& from, const CellData& to);
float NavalMovementCost(const CellData& from, const CellData& to);
float AmphibiousMovementCost(const CellData& from, const CellData& to);

float GetMovementCost(UnitType unit, const CellData& from, const CellData& to);

// Whether a unit may stand on the cell at all (ignoring the step that led there).
bool IsPassable(UnitType unit, const CellData& c);

} // namespace hexregion
