#include "hexregion/HexMetrics.hpp"

#include <cstdlib>

namespace hexregion {

namespace {

// floor(z / 2) for negative rows too.
inline int HalfRowFloor(int z) { return (z >= 0) ? (z / 2) : -((-z + 1) / 2); }

inline bool IsOddRow(int z) { return (z & 1) != 0; }

// Per-direction (dx, dz) for even and odd rows, in HexDirection order.
constexpr int kEvenRowDelta[kHexDirectionCount][2] = {{0, 1}, {1, 0}, {0, -1}, {-1, -1}, {-1, 0}, {-1, 1}};
constexpr int kOddRowDelta[kHexDirectionCount][2] = {{1, 1}, {1, 0}, {1, -1}, {0, -1}, {-1, 0}, {0, 1}};

} // namespace

const char* ToString(HexDirection d)
{
  switch (d) {
  case HexDirection::NE: return "NE";
  case HexDirection::E: return "E";
  case HexDirection::SE: return "SE";
  case HexDirection::SW: return "SW";
  case HexDirection::W: return "W";
  case HexDirection::NW: return "NW";
  default: return "Unknown";
  }
}

HexCoordinates HexCoordinates::FromOffset(int x, int z)
{
  return HexCoordinates{x - HalfRowFloor(z), z};
}

OffsetCoord HexCoordinates::toOffset() const
{
  return OffsetCoord{q + HalfRowFloor(r), r};
}

int HexCoordinates::distanceTo(const HexCoordinates& o) const
{
  const int dq = std::abs(q - o.q);
  const int dr = std::abs(r - o.r);
  const int ds = std::abs(s() - o.s());
  return (dq + dr + ds) / 2;
}

OffsetCoord NeighborOffset(OffsetCoord c, HexDirection d)
{
  const int i = DirectionIndex(d);
  const int(*delta)[2] = IsOddRow(c.z) ? kOddRowDelta : kEvenRowDelta;
  return OffsetCoord{c.x + delta[i][0], c.z + delta[i][1]};
}

int DirectionBetween(OffsetCoord a, OffsetCoord b)
{
  for (int d = 0; d < kHexDirectionCount; ++d) {
    if (NeighborOffset(a, static_cast<HexDirection>(d)) == b) return d;
  }
  return -1;
}

int HexDistance(OffsetCoord a, OffsetCoord b)
{
  return HexCoordinates::FromOffset(a).distanceTo(HexCoordinates::FromOffset(b));
}

Vec3 CellCenter(int x, int z, int elevation)
{
  Vec3 p;
  p.x = (static_cast<float>(x) + (IsOddRow(z) ? 0.5f : 0.0f)) * (kInnerRadius * 2.0f);
  p.y = static_cast<float>(elevation) * kElevationStep;
  p.z = static_cast<float>(z) * (kOuterRadius * 1.5f);
  return p;
}

Vec3 TerraceLerp(const Vec3& a, const Vec3& b, int step)
{
  const float h = static_cast<float>(step) * kHorizontalTerraceStepSize;
  // Vertical movement only happens on odd steps, so integer division is intended.
  const float v = static_cast<float>((step + 1) / 2) * kVerticalTerraceStepSize;

  Vec3 out;
  out.x = a.x + (b.x - a.x) * h;
  out.z = a.z + (b.z - a.z) * h;
  out.y = a.y + (b.y - a.y) * v;
  return out;
}

} // namespace hexregion
