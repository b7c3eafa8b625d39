#pragma once

#include "hexregion/Cell.hpp"
#include "hexregion/HexMetrics.hpp"
#include "hexregion/Region.hpp"

#include <cstdint>
#include <string>

namespace hexregion {

// Narrow mutation interface of a live hex grid (scene, editor, game state).
//
// Implementations own the neighbor bookkeeping: setOutgoingRiver must also mark
// the incoming side on the neighbor and addRoad must set both road bits.
class HexGridAccess {
public:
  virtual ~HexGridAccess() = default;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // nullptr out of bounds.
  virtual const CellData* cell(int x, int z) const = 0;

  // Elevation, water, terrain, feature levels, special, walled and moisture.
  virtual void setCellProperties(int x, int z, const CellData& props) = 0;

  virtual void clearRiversAndRoads(int x, int z) = 0;
  virtual void setOutgoingRiver(int x, int z, HexDirection dir) = 0;
  virtual void addRoad(int x, int z, HexDirection dir) = 0;
};

// HexGridAccess over a RegionData the caller owns.
class RegionGrid final : public HexGridAccess {
public:
  explicit RegionGrid(RegionData& region) : m_region(region) {}

  int width() const override { return m_region.width(); }
  int height() const override { return m_region.height(); }
  const CellData* cell(int x, int z) const override { return m_region.tryGet(x, z); }

  void setCellProperties(int x, int z, const CellData& props) override;
  void clearRiversAndRoads(int x, int z) override;
  void setOutgoingRiver(int x, int z, HexDirection dir) override;
  void addRoad(int x, int z, HexDirection dir) override;

private:
  RegionData& m_region;
};

// Writes a region into a grid in three passes: cell properties (with rivers and
// roads cleared), then outgoing rivers once every elevation is final, then roads.
// Fails when the dimensions differ.
bool ApplyRegionToGrid(const RegionData& region, HexGridAccess& grid, std::string& outError);

// Snapshot of a grid's current state as a new region.
bool ExtractRegionFromGrid(const HexGridAccess& grid, const std::string& name, std::int32_t seed, RegionData& outRegion,
                           std::string& outError);

} // namespace hexregion
