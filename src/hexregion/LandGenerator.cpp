#include "hexregion/LandGenerator.hpp"

#include "hexregion/HexMetrics.hpp"
#include "hexregion/Noise.hpp"
#include "hexregion/Random.hpp"
#include "hexregion/Region.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace hexregion {

namespace {

static void ResetCell(CellData& c)
{
  const std::int16_t x = c.x;
  const std::int16_t z = c.z;
  c = CellData{};
  c.x = x;
  c.z = z;
  c.waterLevel = kLandMinElevation;
}

static int WaterElevation(float v, float threshold)
{
  if (threshold <= 0.0f) return kSeaLevel;
  const int e = static_cast<int>(std::lround(v / threshold * static_cast<float>(kSeaLevel)));
  return std::clamp(e, kMinElevation, kSeaLevel);
}

static int LandElevation(float v, float threshold)
{
  const float span = 1.0f - threshold;
  const float t = (span > 1e-6f) ? std::clamp((v - threshold) / span, 0.0f, 1.0f) : 0.0f;
  const int steps = kMaxElevation - kLandMinElevation;
  const int e = kLandMinElevation + static_cast<int>(t * static_cast<float>(steps));
  return std::min(e, kMaxElevation);
}

} // namespace

float LandThreshold(const std::vector<float>& normalized, float landFraction)
{
  if (normalized.empty()) return 0.0f;
  if (landFraction <= 0.0f) return 2.0f;
  if (landFraction >= 1.0f) return 0.0f;

  std::vector<float> sorted = normalized;
  const std::size_t n = sorted.size();
  std::size_t k = static_cast<std::size_t>(std::floor((1.0f - landFraction) * static_cast<float>(n)));
  k = std::min(k, n - 1);
  std::nth_element(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(k), sorted.end());
  return sorted[k];
}

bool GenerateLand(GenerationContext& ctx, const GenerationConfig& cfg)
{
  if (!ctx.region) return true;
  RegionData& region = *ctx.region;
  const int w = region.width();
  const int h = region.height();
  if (w <= 0 || h <= 0) return true;

  const std::uint32_t seed32 = NoiseSeed32(PassSeed(ctx.seed, kLandSeedOffset));
  const int octaves = std::max(1, cfg.terrainOctaves);

  std::vector<float> values(region.cellCount(), 0.0f);
  float lo = 1e30f;
  float hi = -1e30f;

  for (int z = 0; z < h; ++z) {
    if (ctx.cancelled()) return false;
    for (int x = 0; x < w; ++x) {
      const Vec3 p = CellCenter(x, z, 0);
      const float n = FBm2D(p.x * cfg.terrainScale, p.z * cfg.terrainScale, seed32, octaves);
      values[static_cast<std::size_t>(region.indexOf(x, z))] = n;
      lo = std::min(lo, n);
      hi = std::max(hi, n);
    }
  }

  const float range = hi - lo;
  for (float& v : values) {
    v = (range > 1e-6f) ? (v - lo) / range : 0.5f;
  }

  const float threshold = LandThreshold(values, cfg.landFraction);

  for (int z = 0; z < h; ++z) {
    if (ctx.cancelled()) return false;
    for (int x = 0; x < w; ++x) {
      CellData& c = region.at(x, z);
      ResetCell(c);
      const float v = values[static_cast<std::size_t>(region.indexOf(x, z))];
      if (v < threshold) {
        c.elevation = WaterElevation(v, threshold);
        c.terrainTypeIndex = static_cast<int>(TerrainType::Ocean);
      } else {
        c.elevation = LandElevation(v, threshold);
        c.terrainTypeIndex = static_cast<int>(TerrainType::Plains);
      }
    }
  }

  // Shallow shelf: water next to land sits exactly at sea level.
  for (int i = 0; i < static_cast<int>(region.cellCount()); ++i) {
    CellData& c = region.at(i);
    if (!c.isUnderwater()) continue;
    for (int d = 0; d < kHexDirectionCount; ++d) {
      const int n = region.neighborIndex(i, static_cast<HexDirection>(d));
      if (n >= 0 && !region.at(n).isUnderwater()) {
        c.elevation = kSeaLevel;
        break;
      }
    }
  }

  return true;
}

} // namespace hexregion
