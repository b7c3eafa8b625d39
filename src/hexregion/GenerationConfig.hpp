#pragma once

namespace hexregion {

// Fixed offsets added to the global seed so each pass draws from its own stream.
constexpr int kLandSeedOffset = 0;
constexpr int kMoistureSeedOffset = 1000;
constexpr int kFeatureSeedOffset = 2000;
constexpr int kRoadSeedOffset = 3000;
constexpr int kRiverSeedOffset = 7777;

// Tunables for the region generation pipeline.
//
// The JSON field names used by ConfigIO are the snake_case versions of these.
struct GenerationConfig {
  // --- Land ---
  float landFraction = 0.5f;    // 0..1 share of cells above water
  float terrainScale = 0.08f;   // world-space noise frequency
  int terrainOctaves = 5;

  // --- Climate ---
  float moistureScale = 0.03f;
  int moistureOctaves = 4;
  float coastalMoistureBoost = 0.0f; // 0 keeps moisture a pure function of position
  float temperatureLapseRate = 0.05f; // temperature drop per land elevation step

  // Biome thresholds.
  float desertMoisture = 0.2f;
  float grasslandMoisture = 0.4f;
  float forestMoisture = 0.6f;
  float jungleMoisture = 0.8f;
  float coldTemperature = 0.33f;
  int hillHeight = 2;     // height above LAND_MIN for dry hills
  int mountainHeight = 4; // height above LAND_MIN for mountains
  int snowHeight = 6;     // height above LAND_MIN for snow caps

  // --- Rivers ---
  float riverFraction = 0.05f; // river budget as a share of land cells
  int minRiverLength = 3;      // edges
  int maxRiverLength = 100;    // trace cap
  float riverSourceMinFitness = 0.25f;
  float riverSteepnessWeight = 3.0f;
  float weightedHighThreshold = 0.75f;
  float weightedMediumThreshold = 0.5f;
  float weightHigh = 4.0f;
  float weightMedium = 2.0f;
  float weightLow = 1.0f;

  // --- Features ---
  bool featuresEnabled = true;
  float featureChance = 0.45f;
  float specialFeatureChance = 0.005f;
  int castleMinElevation = 8;
  float megafloraMoisture = 0.85f;

  // --- Roads ---
  bool roadsEnabled = true;
  int settlementUrbanThreshold = 2;
  int maxSettlementDistance = 20; // hex steps between paired settlements
  int maxRoadPathLength = 60;     // cells
  int maxPartnersPerSettlement = 3; // nearest candidates kept per settlement
};

} // namespace hexregion
