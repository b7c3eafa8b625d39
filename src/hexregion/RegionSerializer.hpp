#pragma once

#include "hexregion/Operation.hpp"
#include "hexregion/Region.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace hexregion {

// Binary region file (little-endian):
//
//   header (32 bytes)  magic u32 | version u32 | region id 16 | width i32 | height i32
//   metadata           nameLen i32 | name | seed i32 | generatedAtTicks i64 |
//                      connectionCount i32 | connections...
//   connection         targetId 16 | nameLen i32 | name | departurePort i32 |
//                      arrivalPort i32 | travelTimeMinutes f32 | dangerLevel f32
//   cells              width*height PackedCellData records, row-major
//
// Loads reject bad magic, versions newer than kRegionFileVersion, truncated
// data, out-of-range sizes and river directions outside 0..5 with
// OpStatus::ValidationFailed. On any failure the output RegionData is left
// untouched.

constexpr std::uint32_t kRegionFileMagic = 0x47524858u; // "XHRG" on disk
constexpr std::uint32_t kRegionFileVersion = 1;
constexpr std::size_t kRegionHeaderSize = 32;
constexpr const char* kRegionFileExtension = ".region";

// Progress/cancellation granularity for the cell array.
constexpr int kProgressCellInterval = 10000;

constexpr int kMaxRegionNameBytes = 1024;
constexpr int kMaxRegionDimension = 4096;
constexpr int kMaxRegionConnections = 64;

// Exact byte size SerializeRegion will produce.
std::uint64_t EstimateRegionFileSize(const RegionData& region);

OpResult SerializeRegion(const RegionData& region, std::vector<std::uint8_t>& outBytes,
                         const OperationContext& op = {});
OpResult DeserializeRegion(const std::uint8_t* data, std::size_t size, RegionData& outRegion,
                           const OperationContext& op = {});

// Serialize to memory, then replace the target atomically.
OpResult SaveRegion(const RegionData& region, const std::filesystem::path& path, const OperationContext& op = {});
OpResult LoadRegion(const std::filesystem::path& path, RegionData& outRegion, const OperationContext& op = {});

// Header + metadata only; the cell array is never read.
OpResult ReadRegionMetadata(const std::filesystem::path& path, RegionMetadata& outMeta);

} // namespace hexregion
