#pragma once

#include "hexregion/GenerationConfig.hpp"
#include "hexregion/Operation.hpp"
#include "hexregion/Region.hpp"
#include "hexregion/RiverGenerator.hpp"
#include "hexregion/RoadGenerator.hpp"

#include <cstdint>
#include <string>

namespace hexregion {

struct RegionParams {
  std::string name = "Region";
  int width = kDefaultRegionSize;
  int height = kDefaultRegionSize;
  std::int32_t seed = 0;

  // Nil => a fresh random id.
  RegionId id;
};

// Per-pass summary for logs and tooling.
struct GenerationReport {
  int landCells = 0;
  int waterCells = 0;
  int settlements = 0;
  RiverStats rivers;
  RoadStats roads;
  double elapsedMs = 0.0;
};

// Runs land -> climate -> rivers -> features -> roads into a fresh grid.
//
// The result is moved into outRegion only on success; a cancelled or rejected
// request leaves outRegion untouched. Dimensions outside
// [kMinRegionSize, kMaxRegionSize] fail with ValidationFailed.
OpResult GenerateRegion(const RegionParams& params, const GenerationConfig& cfg, const OperationContext& op,
                        RegionData& outRegion, GenerationReport* outReport = nullptr);

// The passes on an existing grid (no size limits, no identity changes).
// Tests and tools use this to generate small grids.
OpResult RunGenerationPasses(GenerationContext& ctx, const GenerationConfig& cfg, GenerationReport* outReport = nullptr);

} // namespace hexregion
