#pragma once

#include "hexregion/Cell.hpp"
#include "hexregion/GenerationConfig.hpp"
#include "hexregion/Operation.hpp"

namespace hexregion {

// Dry land without rivers can carry density features or a special structure.
bool CanPlaceFeature(const CellData& c);

// Special structure the cell's biome allows, or None.
SpecialFeature SpecialForCell(const CellData& c, const GenerationConfig& cfg);

// Urban/farm/plant density and special structures. Runs after rivers, before
// roads (settlements come from this pass). RNG seed: seed + kFeatureSeedOffset.
//
// Returns false if the operation was cancelled (checked once per row).
bool GenerateFeatures(GenerationContext& ctx, const GenerationConfig& cfg);

} // namespace hexregion
