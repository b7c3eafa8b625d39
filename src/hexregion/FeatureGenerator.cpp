#include "hexregion/FeatureGenerator.hpp"

#include "hexregion/Random.hpp"
#include "hexregion/Region.hpp"

#include <algorithm>

namespace hexregion {

namespace {

// Plains are the only biome that grows towns; keep them rare so settlements
// stay a few dozen per region.
constexpr float kTownChance = 0.04f;
constexpr float kCityChance = 0.25f;
constexpr float kHamletChance = 0.25f;
constexpr float kWallChance = 0.5f;

static void ClearDensity(CellData& c)
{
  c.urbanLevel = 0;
  c.farmLevel = 0;
  c.plantLevel = 0;
  c.walled = false;
}

static void RollDensity(CellData& c, RNG& rng)
{
  switch (c.terrain()) {
  case TerrainType::Plains:
    if (rng.chance(kTownChance)) {
      c.urbanLevel = rng.chance(kCityChance) ? 3 : 2;
      c.walled = (c.urbanLevel == 3) && rng.chance(kWallChance);
    } else if (rng.chance(kHamletChance)) {
      c.urbanLevel = 1;
    }
    c.farmLevel = rng.rangeInt(1, 3);
    c.plantLevel = rng.rangeInt(0, 1);
    break;
  case TerrainType::Savanna:
    c.farmLevel = rng.rangeInt(0, 2);
    c.plantLevel = rng.rangeInt(0, 1);
    break;
  case TerrainType::Hills:
    c.farmLevel = rng.rangeInt(0, 1);
    c.plantLevel = rng.rangeInt(0, 2);
    break;
  case TerrainType::Forest:
  case TerrainType::Taiga:
    c.plantLevel = rng.rangeInt(1, 3);
    break;
  case TerrainType::Jungle:
    c.plantLevel = rng.rangeInt(2, 3);
    break;
  case TerrainType::Tundra:
  case TerrainType::Desert:
    c.plantLevel = rng.rangeInt(0, 1);
    break;
  default:
    break;
  }
}

} // namespace

bool CanPlaceFeature(const CellData& c)
{
  return !c.isUnderwater() && !c.hasRiver();
}

SpecialFeature SpecialForCell(const CellData& c, const GenerationConfig& cfg)
{
  switch (c.terrain()) {
  case TerrainType::Plains:
  case TerrainType::Savanna:
  case TerrainType::Hills:
    return (c.elevation >= cfg.castleMinElevation) ? SpecialFeature::Castle : SpecialFeature::None;
  case TerrainType::Desert:
    return SpecialFeature::Ziggurat;
  case TerrainType::Jungle:
  case TerrainType::Forest:
    return (c.moisture > cfg.megafloraMoisture) ? SpecialFeature::Megaflora : SpecialFeature::None;
  default:
    return SpecialFeature::None;
  }
}

bool GenerateFeatures(GenerationContext& ctx, const GenerationConfig& cfg)
{
  if (!ctx.region) return true;
  RegionData& region = *ctx.region;
  RNG rng(PassSeed(ctx.seed, kFeatureSeedOffset));

  for (int z = 0; z < region.height(); ++z) {
    if (ctx.cancelled()) return false;
    for (int x = 0; x < region.width(); ++x) {
      CellData& c = region.at(x, z);
      ClearDensity(c);
      c.setSpecial(SpecialFeature::None);
      if (!CanPlaceFeature(c)) continue;

      if (rng.chance(cfg.specialFeatureChance)) {
        const SpecialFeature s = SpecialForCell(c, cfg);
        if (s != SpecialFeature::None) {
          c.setSpecial(s);
          continue;
        }
      }

      if (rng.chance(cfg.featureChance)) RollDensity(c, rng);
    }
  }
  return true;
}

} // namespace hexregion
