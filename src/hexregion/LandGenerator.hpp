#pragma once

#include "hexregion/GenerationConfig.hpp"
#include "hexregion/Operation.hpp"

#include <vector>

namespace hexregion {

// Elevation pass.
//
// Samples fractal value noise at every cell's world position, normalizes it to
// [0, 1] and splits the grid at the (1 - landFraction) quantile:
//  - below the threshold: water, elevation 0..kSeaLevel (cells touching land
//    are lifted to kSeaLevel so every shore is a single terrace step)
//  - at or above: land, elevation kLandMinElevation..kMaxElevation
//
// Every cell is reset first (rivers, roads, features, biome) and gets
// waterLevel = kLandMinElevation.
//
// Returns false if the operation was cancelled (checked once per row).
bool GenerateLand(GenerationContext& ctx, const GenerationConfig& cfg);

// Value v such that roughly (1 - landFraction) of the samples are below it.
// landFraction <= 0 yields a threshold above every sample; >= 1 yields 0.
float LandThreshold(const std::vector<float>& normalized, float landFraction);

} // namespace hexregion
