#include "hexregion/PackedCell.hpp"

#include "hexregion/Half.hpp"

#include <algorithm>

namespace hexregion {

namespace {

inline std::int8_t ClampI8(int v)
{
  return static_cast<std::int8_t>(std::clamp(v, -128, 127));
}

inline std::uint8_t ClampU8(int v)
{
  return static_cast<std::uint8_t>(std::clamp(v, 0, 255));
}

inline std::uint8_t Level2(int v)
{
  return static_cast<std::uint8_t>(std::clamp(v, 0, kMaxFeatureLevel) & packed::kLevelMask);
}

inline void PutU16(std::uint8_t* out, std::uint16_t v)
{
  out[0] = static_cast<std::uint8_t>(v & 0xFFu);
  out[1] = static_cast<std::uint8_t>((v >> 8) & 0xFFu);
}

inline std::uint16_t GetU16(const std::uint8_t* in)
{
  return static_cast<std::uint16_t>(static_cast<std::uint16_t>(in[0]) | (static_cast<std::uint16_t>(in[1]) << 8));
}

} // namespace

PackedCellData PackCell(const CellData& cell)
{
  PackedCellData p;
  p.x = cell.x;
  p.z = cell.z;
  p.elevation = ClampI8(cell.elevation);
  p.waterLevel = ClampI8(cell.waterLevel);
  p.terrainTypeIndex = ClampU8(cell.terrainTypeIndex);
  p.specialIndex = ClampU8(cell.specialIndex);

  std::uint8_t features = 0;
  features |= static_cast<std::uint8_t>(Level2(cell.urbanLevel) << packed::kUrbanShift);
  features |= static_cast<std::uint8_t>(Level2(cell.farmLevel) << packed::kFarmShift);
  features |= static_cast<std::uint8_t>(Level2(cell.plantLevel) << packed::kPlantShift);
  if (cell.walled) features |= packed::kWalledBit;
  p.featureFlags = features;

  std::uint8_t river = 0;
  if (cell.hasIncomingRiver) river |= packed::kIncomingRiverBit;
  if (cell.hasOutgoingRiver) river |= packed::kOutgoingRiverBit;
  river |= static_cast<std::uint8_t>((static_cast<unsigned>(cell.incomingRiverDirection) & packed::kDirMask)
                                     << packed::kIncomingDirShift);
  river |= static_cast<std::uint8_t>((static_cast<unsigned>(cell.outgoingRiverDirection) & packed::kDirMask)
                                     << packed::kOutgoingDirShift);
  p.riverFlags = river;

  p.roadFlags = static_cast<std::uint8_t>(cell.roadMask & packed::kRoadMask);
  p.moistureHalf = FloatToHalf(cell.moisture);
  return p;
}

CellData UnpackCell(const PackedCellData& p)
{
  CellData c;
  c.x = p.x;
  c.z = p.z;
  c.elevation = p.elevation;
  c.waterLevel = p.waterLevel;
  c.terrainTypeIndex = p.terrainTypeIndex;
  c.specialIndex = p.specialIndex;

  c.urbanLevel = (p.featureFlags >> packed::kUrbanShift) & packed::kLevelMask;
  c.farmLevel = (p.featureFlags >> packed::kFarmShift) & packed::kLevelMask;
  c.plantLevel = (p.featureFlags >> packed::kPlantShift) & packed::kLevelMask;
  c.walled = (p.featureFlags & packed::kWalledBit) != 0;

  c.hasIncomingRiver = (p.riverFlags & packed::kIncomingRiverBit) != 0;
  c.hasOutgoingRiver = (p.riverFlags & packed::kOutgoingRiverBit) != 0;
  c.incomingRiverDirection = (p.riverFlags >> packed::kIncomingDirShift) & packed::kDirMask;
  c.outgoingRiverDirection = (p.riverFlags >> packed::kOutgoingDirShift) & packed::kDirMask;

  c.roadMask = static_cast<std::uint8_t>(p.roadFlags & packed::kRoadMask);
  c.moisture = HalfToFloat(p.moistureHalf);
  return c;
}

void EncodePackedCell(const PackedCellData& p, std::uint8_t* out)
{
  PutU16(out + 0, static_cast<std::uint16_t>(p.x));
  PutU16(out + 2, static_cast<std::uint16_t>(p.z));
  out[4] = static_cast<std::uint8_t>(p.elevation);
  out[5] = static_cast<std::uint8_t>(p.waterLevel);
  out[6] = p.terrainTypeIndex;
  out[7] = p.specialIndex;
  out[8] = p.featureFlags;
  out[9] = p.riverFlags;
  out[10] = p.roadFlags;
  out[11] = p.reserved;
  PutU16(out + 12, p.moistureHalf);
  PutU16(out + 14, p.padding);
}

PackedCellData DecodePackedCell(const std::uint8_t* in)
{
  PackedCellData p;
  p.x = static_cast<std::int16_t>(GetU16(in + 0));
  p.z = static_cast<std::int16_t>(GetU16(in + 2));
  p.elevation = static_cast<std::int8_t>(in[4]);
  p.waterLevel = static_cast<std::int8_t>(in[5]);
  p.terrainTypeIndex = in[6];
  p.specialIndex = in[7];
  p.featureFlags = in[8];
  p.riverFlags = in[9];
  p.roadFlags = in[10];
  p.reserved = in[11];
  p.moistureHalf = GetU16(in + 12);
  p.padding = GetU16(in + 14);
  return p;
}

} // namespace hexregion
