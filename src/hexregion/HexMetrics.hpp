#pragma once

#include <cstdint>

namespace hexregion {

// Geometry constants and coordinate math for a pointy-top hex grid.
//
// Cells are stored in a flat row-major array addressed by *offset* coordinates
// (x, z), where odd rows are shifted half a cell to the east. Axial coordinates
// (q, r) are derived on demand for distance math and are never stored.

constexpr float kOuterRadius = 1.0f;
constexpr float kOuterToInner = 0.866025404f;
constexpr float kInnerRadius = kOuterRadius * kOuterToInner;
constexpr float kElevationStep = 0.4f;

constexpr int kMinElevation = 0;
constexpr int kSeaLevel = 4;         // highest water elevation
constexpr int kLandMinElevation = 5; // lowest land elevation (one terrace above the sea)
constexpr int kMaxElevation = 13;

// Terrace interpolation (rendering helpers; kept here because they are pure math).
constexpr int kTerracesPerSlope = 2;
constexpr int kTerraceSteps = kTerracesPerSlope * 2 + 1;
constexpr float kHorizontalTerraceStepSize = 1.0f / static_cast<float>(kTerraceSteps);
constexpr float kVerticalTerraceStepSize = 1.0f / static_cast<float>(kTerracesPerSlope + 1);

enum class HexDirection : std::uint8_t {
  NE = 0,
  E = 1,
  SE = 2,
  SW = 3,
  W = 4,
  NW = 5,
};

constexpr int kHexDirectionCount = 6;

inline constexpr HexDirection DirectionFromIndex(int d)
{
  return static_cast<HexDirection>(((d % kHexDirectionCount) + kHexDirectionCount) % kHexDirectionCount);
}

inline constexpr int DirectionIndex(HexDirection d) { return static_cast<int>(d); }

inline constexpr HexDirection Opposite(HexDirection d) { return DirectionFromIndex(DirectionIndex(d) + 3); }
inline constexpr HexDirection Next(HexDirection d) { return DirectionFromIndex(DirectionIndex(d) + 1); }
inline constexpr HexDirection Previous(HexDirection d) { return DirectionFromIndex(DirectionIndex(d) - 1); }

const char* ToString(HexDirection d);

struct Vec3 {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
};

// Storage coordinate (column x, row z).
struct OffsetCoord {
  int x = 0;
  int z = 0;

  bool operator==(const OffsetCoord& o) const { return x == o.x && z == o.z; }
  bool operator!=(const OffsetCoord& o) const { return !(*this == o); }
};

// Axial coordinate (q, r). The implicit third cube axis is s = -q - r.
struct HexCoordinates {
  int q = 0;
  int r = 0;

  int s() const { return -q - r; }

  static HexCoordinates FromOffset(int x, int z);
  static HexCoordinates FromOffset(OffsetCoord c) { return FromOffset(c.x, c.z); }
  OffsetCoord toOffset() const;

  // Number of hex steps between two cells.
  int distanceTo(const HexCoordinates& o) const;

  bool operator==(const HexCoordinates& o) const { return q == o.q && r == o.r; }
  bool operator!=(const HexCoordinates& o) const { return !(*this == o); }
};

// Neighbor of an offset coordinate in direction d. No bounds checking.
OffsetCoord NeighborOffset(OffsetCoord c, HexDirection d);

// Direction from a to an adjacent cell b, or -1 when b is not a neighbor of a.
int DirectionBetween(OffsetCoord a, OffsetCoord b);

// Hex distance between two offset coordinates.
int HexDistance(OffsetCoord a, OffsetCoord b);

// Cell center in world space (y is elevation * kElevationStep).
Vec3 CellCenter(int x, int z, int elevation);

// Terrace interpolation between two points for the given terrace step (0..kTerraceSteps).
Vec3 TerraceLerp(const Vec3& a, const Vec3& b, int step);

} // namespace hexregion
