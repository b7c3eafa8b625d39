#include "hexregion/ClimateGenerator.hpp"

#include "hexregion/HexMetrics.hpp"
#include "hexregion/Noise.hpp"
#include "hexregion/Random.hpp"
#include "hexregion/Region.hpp"

#include <algorithm>
#include <cmath>

namespace hexregion {

namespace {

// Averaged octaves bunch up around 0.5; spread them back over [0, 1].
constexpr float kMoistureContrast = 2.0f;

static bool TouchesWater(const RegionData& region, int index)
{
  for (int d = 0; d < kHexDirectionCount; ++d) {
    const int n = region.neighborIndex(index, static_cast<HexDirection>(d));
    if (n >= 0 && region.at(n).isUnderwater()) return true;
  }
  return false;
}

} // namespace

float ComputeMoisture(int x, int z, std::uint32_t noiseSeed, const GenerationConfig& cfg)
{
  const Vec3 p = CellCenter(x, z, 0);
  const float n = FBm2D(p.x * cfg.moistureScale, p.z * cfg.moistureScale, noiseSeed, std::max(1, cfg.moistureOctaves));
  return std::clamp((n - 0.5f) * kMoistureContrast + 0.5f, 0.0f, 1.0f);
}

float ComputeTemperature(int z, int height, int elevation, const GenerationConfig& cfg)
{
  float latitude = 1.0f;
  if (height > 1) {
    const float t = (static_cast<float>(z) + 0.5f) / static_cast<float>(height);
    latitude = 1.0f - std::fabs(t * 2.0f - 1.0f);
  }
  const int aboveLand = std::max(0, elevation - kLandMinElevation);
  return std::clamp(latitude - cfg.temperatureLapseRate * static_cast<float>(aboveLand), 0.0f, 1.0f);
}

TerrainType ClassifyBiome(int elevation, float moisture, float temperature, const GenerationConfig& cfg)
{
  if (elevation < kLandMinElevation) {
    return (elevation < kSeaLevel - 2) ? TerrainType::Ocean : TerrainType::Coast;
  }

  const int height = elevation - kLandMinElevation;
  if (height >= cfg.snowHeight) return TerrainType::Snow;
  if (height >= cfg.mountainHeight) return TerrainType::Mountains;

  if (temperature < cfg.coldTemperature) {
    return (moisture < cfg.grasslandMoisture) ? TerrainType::Tundra : TerrainType::Taiga;
  }

  if (moisture < cfg.desertMoisture) return TerrainType::Desert;
  if (moisture < cfg.grasslandMoisture) {
    return (height >= cfg.hillHeight) ? TerrainType::Hills : TerrainType::Savanna;
  }
  if (moisture < cfg.forestMoisture) return TerrainType::Plains;
  if (moisture < cfg.jungleMoisture) return TerrainType::Forest;
  return TerrainType::Jungle;
}

bool GenerateClimate(GenerationContext& ctx, const GenerationConfig& cfg)
{
  if (!ctx.region) return true;
  RegionData& region = *ctx.region;
  const int w = region.width();
  const int h = region.height();

  const std::uint32_t seed32 = NoiseSeed32(PassSeed(ctx.seed, kMoistureSeedOffset));
  const bool boostCoast = cfg.coastalMoistureBoost > 0.0f;

  for (int z = 0; z < h; ++z) {
    if (ctx.cancelled()) return false;
    for (int x = 0; x < w; ++x) {
      CellData& c = region.at(x, z);
      float m = ComputeMoisture(x, z, seed32, cfg);
      if (boostCoast && !c.isUnderwater() && TouchesWater(region, region.indexOf(x, z))) {
        m = std::min(1.0f, m + cfg.coastalMoistureBoost);
      }
      c.moisture = m;

      const float temperature = ComputeTemperature(z, h, c.elevation, cfg);
      c.terrainTypeIndex = static_cast<int>(ClassifyBiome(c.elevation, m, temperature, cfg));
    }
  }
  return true;
}

} // namespace hexregion
