#pragma once

#include "hexregion/Cell.hpp"

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace hexregion {

// Bit layout of the packed flag bytes.
namespace packed {

// featureFlags: urban bits 0-1, farm bits 2-3, plant bits 4-5, walled bit 6.
constexpr std::uint8_t kUrbanShift = 0;
constexpr std::uint8_t kFarmShift = 2;
constexpr std::uint8_t kPlantShift = 4;
constexpr std::uint8_t kLevelMask = 0x3;
constexpr std::uint8_t kWalledBit = 0x40;

// riverFlags: incoming bit 0, outgoing bit 1, incoming dir bits 2-4, outgoing dir bits 5-7.
constexpr std::uint8_t kIncomingRiverBit = 0x01;
constexpr std::uint8_t kOutgoingRiverBit = 0x02;
constexpr std::uint8_t kIncomingDirShift = 2;
constexpr std::uint8_t kOutgoingDirShift = 5;
constexpr std::uint8_t kDirMask = 0x7;

// roadFlags: bit d = road through edge d.
constexpr std::uint8_t kRoadMask = 0x3F;

} // namespace packed

// Fixed 16-byte on-disk cell record. Field order matches the file layout.
struct PackedCellData {
  std::int16_t x = 0;
  std::int16_t z = 0;
  std::int8_t elevation = 0;
  std::int8_t waterLevel = 0;
  std::uint8_t terrainTypeIndex = 0;
  std::uint8_t specialIndex = 0;
  std::uint8_t featureFlags = 0;
  std::uint8_t riverFlags = 0;
  std::uint8_t roadFlags = 0;
  std::uint8_t reserved = 0;
  std::uint16_t moistureHalf = 0;
  std::uint16_t padding = 0;
};

static_assert(sizeof(PackedCellData) == 16, "PackedCellData must be exactly 16 bytes");
static_assert(std::is_trivially_copyable_v<PackedCellData>);

constexpr std::size_t kPackedCellSize = 16;

PackedCellData PackCell(const CellData& cell);
CellData UnpackCell(const PackedCellData& packed);

// Little-endian byte encoding of one record (exactly kPackedCellSize bytes).
void EncodePackedCell(const PackedCellData& p, std::uint8_t* out);
PackedCellData DecodePackedCell(const std::uint8_t* in);

} // namespace hexregion
