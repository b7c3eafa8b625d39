#pragma once

#include "hexregion/Cell.hpp"
#include "hexregion/HexMetrics.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hexregion {

// Region size limits for generated regions.
constexpr int kDefaultRegionSize = 200;
constexpr int kMinRegionSize = 50;
constexpr int kMaxRegionSize = 300;

// Opaque 16-byte region identity (random v4 UUID layout).
struct RegionId {
  std::array<std::uint8_t, 16> bytes{};

  static RegionId Generate(std::uint64_t entropy);

  bool isNil() const;
  std::string toString() const;
  static bool Parse(const std::string& text, RegionId& out);

  bool operator==(const RegionId& o) const { return bytes == o.bytes; }
  bool operator!=(const RegionId& o) const { return bytes != o.bytes; }
};

// A travel link from this region to another one.
struct RegionConnection {
  RegionId targetId;
  std::string targetName;
  int departurePortIndex = -1; // cell index in this region
  int arrivalPortIndex = -1;   // cell index in the target region
  float travelTimeMinutes = 0.0f;
  float dangerLevel = 0.0f;

  bool operator==(const RegionConnection& o) const;
  bool operator!=(const RegionConnection& o) const { return !(*this == o); }
};

// Lightweight catalog entry read without touching the cell array.
struct RegionMetadata {
  RegionId id;
  std::string name;
  int width = 0;
  int height = 0;
  std::int32_t seed = 0;
  std::int64_t generatedAtTicks = 0;
  std::vector<RegionConnection> connections;
  std::uint64_t fileSizeBytes = 0;
};

// 100 ns ticks since 0001-01-01T00:00:00Z for the current wall clock.
std::int64_t NowTicks();

// Flat hex grid plus region identity.
//
// Cells live in one contiguous vector indexed z*width + x. Neighbors are derived
// from coordinates; no cell stores references to another.
class RegionData {
public:
  RegionData() = default;

  // Allocates width*height default cells with their coordinates filled in.
  void reset(int width, int height);

  int width() const { return m_w; }
  int height() const { return m_h; }
  std::size_t cellCount() const { return m_cells.size(); }
  bool empty() const { return m_cells.empty(); }

  bool inBounds(int x, int z) const { return x >= 0 && z >= 0 && x < m_w && z < m_h; }
  bool inBounds(OffsetCoord c) const { return inBounds(c.x, c.z); }

  int indexOf(int x, int z) const { return z * m_w + x; }
  int indexOf(OffsetCoord c) const { return indexOf(c.x, c.z); }
  OffsetCoord coordOf(int index) const { return OffsetCoord{index % m_w, index / m_w}; }

  // Unchecked access.
  CellData& at(int x, int z) { return m_cells[static_cast<std::size_t>(z) * static_cast<std::size_t>(m_w) + static_cast<std::size_t>(x)]; }
  const CellData& at(int x, int z) const
  {
    return m_cells[static_cast<std::size_t>(z) * static_cast<std::size_t>(m_w) + static_cast<std::size_t>(x)];
  }
  CellData& at(int index) { return m_cells[static_cast<std::size_t>(index)]; }
  const CellData& at(int index) const { return m_cells[static_cast<std::size_t>(index)]; }

  // Checked access: nullptr when out of bounds.
  CellData* tryGet(int x, int z) { return inBounds(x, z) ? &at(x, z) : nullptr; }
  const CellData* tryGet(int x, int z) const { return inBounds(x, z) ? &at(x, z) : nullptr; }
  const CellData* tryGet(OffsetCoord c) const { return tryGet(c.x, c.z); }

  // Neighbor cell index in direction d, or -1 off the grid.
  int neighborIndex(int index, HexDirection d) const;
  const CellData* neighbor(int x, int z, HexDirection d) const;

  std::vector<CellData>& cells() { return m_cells; }
  const std::vector<CellData>& cells() const { return m_cells; }

  // Identity + metadata.
  RegionId id;
  std::string name;
  std::int32_t seed = 0;
  std::int64_t generatedAtTicks = 0;
  std::vector<RegionConnection> connections;

  RegionMetadata metadata() const;

  int landCellCount() const;

private:
  int m_w = 0;
  int m_h = 0;
  std::vector<CellData> m_cells;
};

// Valid size for a *generated* region.
bool IsValidRegionSize(int width, int height);

} // namespace hexregion
