#pragma once

#include "hexregion/Cell.hpp"
#include "hexregion/GenerationConfig.hpp"
#include "hexregion/Operation.hpp"

namespace hexregion {

struct RiverStats {
  int budget = 0;           // river segments allowed
  int sourceCandidates = 0; // sources that passed the fitness filter
  int attempts = 0;
  int riversCommitted = 0;
  int segmentsCommitted = 0;
  int tracesDiscarded = 0;  // shorter than minRiverLength
};

// moisture * normalized height above sea level, in [0, 1].
float RiverSourceFitness(const CellData& c);

// River pass (steepest descent with weighted choices). Runs after climate.
//
// Sources are land cells away from water and existing rivers whose fitness is at
// least cfg.riverSourceMinFitness. Traces only ever step to strictly lower
// neighbors and end at water, at an existing river, in a pit, or at
// cfg.maxRiverLength. Traces shorter than cfg.minRiverLength edges are dropped.
//
// All random choices come from one RNG seeded with (seed + kRiverSeedOffset).
//
// Returns false if the operation was cancelled.
bool GenerateRivers(GenerationContext& ctx, const GenerationConfig& cfg, RiverStats* outStats = nullptr);

} // namespace hexregion
