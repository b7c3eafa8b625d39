#pragma once

#include "hexregion/Cell.hpp"
#include "hexregion/GenerationConfig.hpp"
#include "hexregion/Operation.hpp"

#include <cstdint>

namespace hexregion {

// Moisture + biome pass. Runs after GenerateLand.
//
// Moisture is a second noise field seeded with kMoistureSeedOffset; it does not
// depend on elevation unless cfg.coastalMoistureBoost > 0. Temperature is not
// stored; it is recomputed from latitude and elevation when classifying.
//
// Returns false if the operation was cancelled (checked once per row).
bool GenerateClimate(GenerationContext& ctx, const GenerationConfig& cfg);

// Raw moisture in [0, 1] for a cell, before any coastal boost.
float ComputeMoisture(int x, int z, std::uint32_t noiseSeed, const GenerationConfig& cfg);

// 1 on the middle row, 0 on the top/bottom rows, minus a lapse per land step.
float ComputeTemperature(int z, int height, int elevation, const GenerationConfig& cfg);

TerrainType ClassifyBiome(int elevation, float moisture, float temperature, const GenerationConfig& cfg);

} // namespace hexregion
