#include "hexregion/ClimateGenerator.hpp"
#include "hexregion/ConfigIO.hpp"
#include "hexregion/FeatureGenerator.hpp"
#include "hexregion/GridBridge.hpp"
#include "hexregion/Half.hpp"
#include "hexregion/HexMetrics.hpp"
#include "hexregion/Json.hpp"
#include "hexregion/LandGenerator.hpp"
#include "hexregion/Log.hpp"
#include "hexregion/LogTee.hpp"
#include "hexregion/PackedCell.hpp"
#include "hexregion/Pathfinding.hpp"
#include "hexregion/RegionGenerator.hpp"
#include "hexregion/RegionSerializer.hpp"
#include "hexregion/RegionTasks.hpp"
#include "hexregion/RiverGenerator.hpp"
#include "hexregion/RoadGenerator.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace hexregion;

fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp =
      static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

// Every cell dry Plains at the lowest land elevation.
RegionData MakeFlatPlains(int w, int h)
{
  RegionData r;
  r.reset(w, h);
  for (CellData& c : r.cells()) {
    c.elevation = kLandMinElevation;
    c.waterLevel = kSeaLevel;
    c.terrainTypeIndex = static_cast<int>(TerrainType::Plains);
    c.moisture = 0.5f;
  }
  return r;
}

// Full pass pipeline on a grid below the generated-region minimum.
RegionData GenerateSmall(std::int32_t seed, int w, int h, const GenerationConfig& cfg = GenerationConfig{})
{
  RegionData r;
  r.reset(w, h);
  r.name = "Small";
  r.seed = seed;
  r.id = RegionId::Generate(static_cast<std::uint64_t>(seed) + 1u);

  GenerationContext ctx;
  ctx.region = &r;
  ctx.seed = seed;
  const OpResult res = RunGenerationPasses(ctx, cfg);
  EXPECT_TRUE(res.ok());
  return r;
}

void TestHexNeighborsAndDistance()
{
  // Even row.
  EXPECT_TRUE(NeighborOffset(OffsetCoord{3, 2}, HexDirection::NE) == (OffsetCoord{3, 3}));
  EXPECT_TRUE(NeighborOffset(OffsetCoord{3, 2}, HexDirection::SW) == (OffsetCoord{2, 1}));
  // Odd row.
  EXPECT_TRUE(NeighborOffset(OffsetCoord{3, 3}, HexDirection::NE) == (OffsetCoord{4, 4}));
  EXPECT_TRUE(NeighborOffset(OffsetCoord{3, 3}, HexDirection::W) == (OffsetCoord{2, 3}));

  for (int d = 0; d < kHexDirectionCount; ++d) {
    const HexDirection dir = static_cast<HexDirection>(d);
    EXPECT_EQ(Opposite(Opposite(dir)), dir);
    for (int z = 0; z < 2; ++z) {
      const OffsetCoord a{5, 4 + z};
      const OffsetCoord b = NeighborOffset(a, dir);
      EXPECT_EQ(HexDistance(a, b), 1);
      EXPECT_EQ(DirectionBetween(a, b), d);
      EXPECT_TRUE(NeighborOffset(b, Opposite(dir)) == a);
    }
  }
  EXPECT_EQ(Next(HexDirection::NW), HexDirection::NE);
  EXPECT_EQ(Previous(HexDirection::NE), HexDirection::NW);

  EXPECT_EQ(HexDistance(OffsetCoord{0, 0}, OffsetCoord{9, 9}), 14);
  EXPECT_EQ(DirectionBetween(OffsetCoord{0, 0}, OffsetCoord{2, 0}), -1);
}

void TestWorldPositionAndTerraces()
{
  const Vec3 origin = CellCenter(0, 0, 0);
  EXPECT_NEAR(origin.x, 0.0f, 1e-6f);
  EXPECT_NEAR(origin.y, 0.0f, 1e-6f);
  EXPECT_NEAR(origin.z, 0.0f, 1e-6f);

  // Odd rows shift half a cell.
  const Vec3 p = CellCenter(1, 1, 2);
  EXPECT_NEAR(p.x, 1.5f * 2.0f * kInnerRadius, 1e-5f);
  EXPECT_NEAR(p.y, 2.0f * kElevationStep, 1e-6f);
  EXPECT_NEAR(p.z, 1.5f * kOuterRadius, 1e-6f);
  EXPECT_NEAR(CellCenter(1, 2, 0).x, 2.0f * kInnerRadius, 1e-5f);

  Vec3 a;
  Vec3 b;
  b.x = 1.0f;
  b.y = 1.0f;
  b.z = 1.0f;
  const Vec3 s1 = TerraceLerp(a, b, 1);
  EXPECT_NEAR(s1.x, 0.2f, 1e-6f);
  EXPECT_NEAR(s1.y, 1.0f / 3.0f, 1e-6f);
  const Vec3 s2 = TerraceLerp(a, b, 2);
  EXPECT_NEAR(s2.x, 0.4f, 1e-6f);
  EXPECT_NEAR(s2.y, 1.0f / 3.0f, 1e-6f);
  const Vec3 last = TerraceLerp(a, b, kTerraceSteps);
  EXPECT_NEAR(last.x, 1.0f, 1e-6f);
  EXPECT_NEAR(last.y, 1.0f, 1e-6f);
  EXPECT_NEAR(last.z, 1.0f, 1e-6f);

  RegionData r = MakeFlatPlains(5, 5);
  EXPECT_TRUE(r.neighbor(2, 2, HexDirection::E) == &r.at(3, 2));
  EXPECT_TRUE(r.neighbor(2, 2, HexDirection::NE) == &r.at(2, 3));
  EXPECT_TRUE(r.neighbor(1, 1, HexDirection::NE) == &r.at(2, 2));
  EXPECT_TRUE(r.neighbor(0, 0, HexDirection::W) == nullptr);
  EXPECT_TRUE(r.neighbor(4, 4, HexDirection::NE) == nullptr);
  EXPECT_TRUE(r.neighbor(7, 0, HexDirection::W) == nullptr);
}

void TestPackedCellBoundaries()
{
  CellData c;
  c.x = 4095;
  c.z = 4095;
  c.elevation = kMaxElevation;
  c.waterLevel = 0;
  c.terrainTypeIndex = static_cast<int>(TerrainType::Taiga);
  c.urbanLevel = 3;
  c.farmLevel = 3;
  c.plantLevel = 3;
  c.walled = true;
  c.specialIndex = static_cast<int>(SpecialFeature::Megaflora);
  c.hasIncomingRiver = true;
  c.incomingRiverDirection = 5;
  c.hasOutgoingRiver = true;
  c.outgoingRiverDirection = 2;
  c.roadMask = 0x3F;
  c.moisture = 1.0f;

  const PackedCellData p = PackCell(c);
  EXPECT_EQ(p.featureFlags, static_cast<std::uint8_t>(0x7F));
  EXPECT_EQ(p.riverFlags, static_cast<std::uint8_t>(0x03 | (5 << 2) | (2 << 5)));
  EXPECT_EQ(p.roadFlags, static_cast<std::uint8_t>(0x3F));
  EXPECT_TRUE(UnpackCell(p) == c);

  std::uint8_t bytes[kPackedCellSize] = {};
  EncodePackedCell(p, bytes);
  EXPECT_EQ(bytes[0], static_cast<std::uint8_t>(0xFF)); // x low byte
  EXPECT_EQ(bytes[1], static_cast<std::uint8_t>(0x0F));
  EXPECT_EQ(bytes[4], static_cast<std::uint8_t>(kMaxElevation));
  EXPECT_TRUE(UnpackCell(DecodePackedCell(bytes)) == c);

  CellData empty;
  empty.moisture = 0.0f;
  EXPECT_TRUE(UnpackCell(PackCell(empty)) == empty);

  // Moisture is stored as a half float.
  CellData m;
  m.moisture = 0.3f;
  const CellData back = UnpackCell(PackCell(m));
  EXPECT_NEAR(back.moisture, 0.3f, 1e-3f);
  EXPECT_EQ(HalfToFloat(FloatToHalf(0.5f)), 0.5f);
}

void TestCellRiverAndRoadRules()
{
  CellData c;
  c.setRoad(1, true);
  c.setRoad(4, true);
  EXPECT_TRUE(c.hasRoadThroughEdge(1));

  // A river edge removes the road on that edge only.
  c.setOutgoingRiver(1);
  EXPECT_FALSE(c.hasRoadThroughEdge(1));
  EXPECT_TRUE(c.hasRoadThroughEdge(4));
  EXPECT_TRUE(c.hasRiverBeginOrEnd());

  c.setIncomingRiver(4);
  EXPECT_TRUE(c.isRiverStraightThrough());
  EXPECT_FALSE(c.hasRiverBeginOrEnd());

  c.setSpecial(SpecialFeature::Castle);
  EXPECT_FALSE(c.hasRoads());

  c.removeRiver();
  EXPECT_FALSE(c.hasRiver());
}

void TestRegionIdFormat()
{
  const RegionId a = RegionId::Generate(12345u);
  const RegionId b = RegionId::Generate(12346u);
  EXPECT_FALSE(a.isNil());
  EXPECT_TRUE(a != b);

  const std::string text = a.toString();
  EXPECT_EQ(text.size(), static_cast<std::size_t>(36));
  RegionId parsed;
  EXPECT_TRUE(RegionId::Parse(text, parsed));
  EXPECT_TRUE(parsed == a);
  EXPECT_FALSE(RegionId::Parse("not-a-uuid", parsed));
}

void TestLandThreshold()
{
  std::vector<float> v;
  for (int i = 0; i < 10; ++i) v.push_back(static_cast<float>(i) / 9.0f);

  EXPECT_EQ(LandThreshold(v, 0.0f), 2.0f);
  EXPECT_EQ(LandThreshold(v, 1.0f), 0.0f);

  const float t = LandThreshold(v, 0.5f);
  int above = 0;
  for (float x : v) {
    if (x >= t) ++above;
  }
  EXPECT_EQ(above, 5);
}

void TestGenerationDeterministic()
{
  const RegionData a = GenerateSmall(1234, 40, 36);
  const RegionData b = GenerateSmall(1234, 40, 36);
  const RegionData c = GenerateSmall(1235, 40, 36);

  EXPECT_TRUE(a.cells() == b.cells());
  EXPECT_FALSE(a.cells() == c.cells());
}

void TestSeed42HasLandAndWater()
{
  RegionParams params;
  params.name = "Seed42";
  params.width = 50;
  params.height = 50;
  params.seed = 42;

  RegionData region;
  GenerationReport report;
  const OpResult r = GenerateRegion(params, GenerationConfig{}, OperationContext{}, region, &report);
  ASSERT_TRUE(r.ok());

  EXPECT_EQ(region.width(), 50);
  EXPECT_EQ(region.name, std::string("Seed42"));
  EXPECT_FALSE(region.id.isNil());
  EXPECT_TRUE(region.generatedAtTicks > 0);
  EXPECT_TRUE(report.landCells > 0);
  EXPECT_TRUE(report.waterCells > 0);
  EXPECT_EQ(report.landCells + report.waterCells, 2500);

  for (const CellData& c : region.cells()) {
    EXPECT_TRUE(c.elevation >= kMinElevation && c.elevation <= kMaxElevation);
    EXPECT_TRUE(c.moisture >= 0.0f && c.moisture <= 1.0f);
    if (c.isUnderwater()) {
      EXPECT_TRUE(c.elevation <= kSeaLevel);
      EXPECT_TRUE(c.terrain() == TerrainType::Ocean || c.terrain() == TerrainType::Coast);
    } else {
      EXPECT_TRUE(c.elevation >= kLandMinElevation);
    }
  }
}

void TestGenerateRegionRejectsBadSize()
{
  RegionParams params;
  params.width = 49;
  params.height = 100;

  RegionData region;
  region.name = "untouched";
  const OpResult r = GenerateRegion(params, GenerationConfig{}, OperationContext{}, region);
  EXPECT_EQ(r.status, OpStatus::ValidationFailed);
  EXPECT_EQ(region.name, std::string("untouched"));
  EXPECT_TRUE(region.empty());

  params.width = 301;
  params.height = 60;
  EXPECT_EQ(GenerateRegion(params, GenerationConfig{}, OperationContext{}, region).status, OpStatus::ValidationFailed);
}

void TestClimateRules()
{
  const GenerationConfig cfg;
  EXPECT_EQ(ClassifyBiome(0, 0.5f, 0.5f, cfg), TerrainType::Ocean);
  EXPECT_EQ(ClassifyBiome(kSeaLevel, 0.5f, 0.5f, cfg), TerrainType::Coast);
  EXPECT_EQ(ClassifyBiome(kLandMinElevation + cfg.snowHeight, 0.5f, 0.9f, cfg), TerrainType::Snow);
  EXPECT_EQ(ClassifyBiome(kLandMinElevation + cfg.mountainHeight, 0.5f, 0.9f, cfg), TerrainType::Mountains);
  EXPECT_EQ(ClassifyBiome(kLandMinElevation, 0.1f, 0.9f, cfg), TerrainType::Desert);
  EXPECT_EQ(ClassifyBiome(kLandMinElevation, 0.5f, 0.9f, cfg), TerrainType::Plains);
  EXPECT_EQ(ClassifyBiome(kLandMinElevation, 0.9f, 0.9f, cfg), TerrainType::Jungle);
  EXPECT_EQ(ClassifyBiome(kLandMinElevation, 0.1f, 0.1f, cfg), TerrainType::Tundra);

  // Warmer at mid-latitude than at the edge, colder higher up.
  const int h = 100;
  EXPECT_TRUE(ComputeTemperature(h / 2, h, kLandMinElevation, cfg) > ComputeTemperature(0, h, kLandMinElevation, cfg));
  EXPECT_TRUE(ComputeTemperature(h / 2, h, kLandMinElevation + 6, cfg) <
              ComputeTemperature(h / 2, h, kLandMinElevation, cfg));

  // Moisture is a pure function of position and seed.
  EXPECT_EQ(ComputeMoisture(7, 9, 99u, cfg), ComputeMoisture(7, 9, 99u, cfg));
  const float m = ComputeMoisture(7, 9, 99u, cfg);
  EXPECT_TRUE(m >= 0.0f && m <= 1.0f);
}

void TestRiversFlowDownhill()
{
  GenerationConfig cfg;
  cfg.riverFraction = 0.2f;
  cfg.riverSourceMinFitness = 0.05f;
  const RegionData r = GenerateSmall(77, 48, 48, cfg);

  for (int i = 0; i < static_cast<int>(r.cellCount()); ++i) {
    const CellData& c = r.at(i);
    if (!c.hasOutgoingRiver) continue;

    EXPECT_FALSE(c.isUnderwater());
    const int n = r.neighborIndex(i, static_cast<HexDirection>(c.outgoingRiverDirection));
    ASSERT_TRUE(n >= 0);
    const CellData& down = r.at(n);
    EXPECT_TRUE(down.elevation < c.elevation);
    EXPECT_TRUE(down.hasIncomingRiver || down.isUnderwater());
    EXPECT_FALSE(c.hasRoadThroughEdge(c.outgoingRiverDirection));
  }

  for (int i = 0; i < static_cast<int>(r.cellCount()); ++i) {
    const CellData& c = r.at(i);
    if (!c.hasIncomingRiver) continue;
    // The upstream cell drains into this one.
    const int up = r.neighborIndex(i, static_cast<HexDirection>(c.incomingRiverDirection));
    ASSERT_TRUE(up >= 0);
    const CellData& uc = r.at(up);
    EXPECT_TRUE(uc.hasOutgoingRiver);
    EXPECT_EQ(uc.outgoingRiverDirection, DirectionIndex(Opposite(static_cast<HexDirection>(c.incomingRiverDirection))));
  }
}

void TestRiverSourceFitness()
{
  CellData c;
  c.moisture = 1.0f;
  c.elevation = kMaxElevation;
  EXPECT_NEAR(RiverSourceFitness(c), 1.0f, 1e-6f);
  c.elevation = kSeaLevel;
  EXPECT_NEAR(RiverSourceFitness(c), 0.0f, 1e-6f);
}

void TestFeaturesAvoidWaterAndRivers()
{
  const RegionData r = GenerateSmall(2024, 48, 40);
  for (const CellData& c : r.cells()) {
    const bool hasFeature = c.urbanLevel > 0 || c.farmLevel > 0 || c.plantLevel > 0 ||
                            c.special() != SpecialFeature::None || c.walled;
    if (!hasFeature) continue;
    EXPECT_TRUE(CanPlaceFeature(c));
    EXPECT_TRUE(c.urbanLevel <= kMaxFeatureLevel && c.farmLevel <= kMaxFeatureLevel &&
                c.plantLevel <= kMaxFeatureLevel);
  }

  CellData wet;
  wet.elevation = 2;
  wet.waterLevel = kSeaLevel;
  EXPECT_FALSE(CanPlaceFeature(wet));
}

void TestRoadsSymmetricAndLegal()
{
  GenerationConfig cfg;
  cfg.featureChance = 0.9f;
  const RegionData r = GenerateSmall(99, 60, 60, cfg);

  for (int i = 0; i < static_cast<int>(r.cellCount()); ++i) {
    const CellData& c = r.at(i);
    for (int d = 0; d < kHexDirectionCount; ++d) {
      if (!c.hasRoadThroughEdge(d)) continue;
      const HexDirection dir = static_cast<HexDirection>(d);
      const int n = r.neighborIndex(i, dir);
      ASSERT_TRUE(n >= 0);
      const CellData& nc = r.at(n);
      EXPECT_TRUE(nc.hasRoadThroughEdge(DirectionIndex(Opposite(dir))));
      EXPECT_FALSE(c.isUnderwater());
      EXPECT_FALSE(c.isMegaflora());
      EXPECT_TRUE(std::abs(c.elevation - nc.elevation) <= 1);
      EXPECT_FALSE(c.hasRiverThroughEdge(d));
    }
  }
}

void TestApplyRoadPathAndCosts()
{
  RegionData r = MakeFlatPlains(8, 8);
  const int a = r.indexOf(1, 1);
  const int b = r.neighborIndex(a, HexDirection::E);
  const int c = r.neighborIndex(b, HexDirection::NE);
  const std::vector<int> path{a, b, c};

  EXPECT_EQ(RoadStepCost(r, a, b, HexDirection::E), 1.0f);
  EXPECT_EQ(ApplyRoadPath(r, path), 2);
  EXPECT_EQ(ApplyRoadPath(r, path), 0);
  EXPECT_TRUE(r.at(a).hasRoadThroughEdge(DirectionIndex(HexDirection::E)));
  EXPECT_TRUE(r.at(b).hasRoadThroughEdge(DirectionIndex(HexDirection::W)));
  EXPECT_TRUE(r.at(c).hasRoadThroughEdge(DirectionIndex(HexDirection::SW)));
  EXPECT_EQ(RoadStepCost(r, a, b, HexDirection::E), 1.0f);

  // Cliffs and megaflora block roads.
  r.at(5, 5).elevation = kLandMinElevation + 2;
  const int cliff = r.indexOf(4, 5);
  EXPECT_FALSE(CanPlaceRoad(r, cliff, HexDirection::E));
  r.at(2, 5).setSpecial(SpecialFeature::Megaflora);
  EXPECT_FALSE(CanPlaceRoad(r, r.indexOf(3, 5), HexDirection::W));

  // A straight river allows a bridge across its free edges only.
  CellData& river = r.at(4, 3);
  river.setIncomingRiver(DirectionIndex(HexDirection::W));
  river.setOutgoingRiver(DirectionIndex(HexDirection::E));
  EXPECT_FALSE(CanPlaceRoad(r, r.indexOf(4, 3), HexDirection::E));
  EXPECT_TRUE(CanPlaceRoad(r, r.indexOf(4, 3), HexDirection::NE));
}

void TestRoadsBesideRiverEdges()
{
  RegionData r = MakeFlatPlains(10, 10);
  const int source = r.indexOf(4, 4);
  r.at(source).setOutgoingRiver(DirectionIndex(HexDirection::E));

  EXPECT_TRUE(CanPlaceRoad(r, source, HexDirection::W));
  EXPECT_TRUE(CanPlaceRoad(r, source, HexDirection::SW));
  EXPECT_FALSE(CanPlaceRoad(r, source, HexDirection::E));
  EXPECT_FALSE(CanPlaceRoad(r, r.neighborIndex(source, HexDirection::E), HexDirection::W));
  EXPECT_EQ(ApplyRoadPath(r, std::vector<int>{source, r.neighborIndex(source, HexDirection::W)}), 1);
  EXPECT_TRUE(r.at(source).hasRoadThroughEdge(DirectionIndex(HexDirection::W)));

  // A bend keeps its four dry edges open.
  const int bend = r.indexOf(6, 7);
  r.at(bend).setIncomingRiver(DirectionIndex(HexDirection::NE));
  r.at(bend).setOutgoingRiver(DirectionIndex(HexDirection::E));
  EXPECT_FALSE(r.at(bend).isRiverStraightThrough());
  EXPECT_TRUE(CanPlaceRoad(r, bend, HexDirection::SW));
  EXPECT_TRUE(CanPlaceRoad(r, bend, HexDirection::W));
  EXPECT_FALSE(CanPlaceRoad(r, bend, HexDirection::NE));
  EXPECT_FALSE(CanPlaceRoad(r, bend, HexDirection::E));
  EXPECT_TRUE(RoadStepCost(r, bend, r.neighborIndex(bend, HexDirection::SW), HexDirection::SW) > 1.0f);
}

void TestSettlementDetection()
{
  const GenerationConfig cfg;
  CellData c;
  c.elevation = kLandMinElevation;
  c.waterLevel = kLandMinElevation;
  EXPECT_FALSE(c.isUnderwater());
  EXPECT_FALSE(IsSettlement(c, cfg));

  c.urbanLevel = cfg.settlementUrbanThreshold - 1;
  EXPECT_FALSE(IsSettlement(c, cfg));
  c.urbanLevel = cfg.settlementUrbanThreshold;
  EXPECT_TRUE(IsSettlement(c, cfg));

  CellData castle = c;
  castle.urbanLevel = 0;
  castle.setSpecial(SpecialFeature::Castle);
  EXPECT_TRUE(IsSettlement(castle, cfg));
  CellData ziggurat = c;
  ziggurat.urbanLevel = 0;
  ziggurat.setSpecial(SpecialFeature::Ziggurat);
  EXPECT_TRUE(IsSettlement(ziggurat, cfg));

  CellData flora = c;
  flora.setSpecial(SpecialFeature::Megaflora);
  flora.urbanLevel = kMaxFeatureLevel;
  EXPECT_FALSE(IsSettlement(flora, cfg));

  CellData flooded = c;
  flooded.urbanLevel = kMaxFeatureLevel;
  flooded.waterLevel = flooded.elevation + 1;
  EXPECT_FALSE(IsSettlement(flooded, cfg));

  EXPECT_EQ(std::string(ToString(SpecialFeature::Castle)), std::string("Castle"));
  EXPECT_EQ(std::string(ToString(SpecialFeature::Megaflora)), std::string("Megaflora"));
}

void TestRoadsConnectSettlements()
{
  RegionData r = MakeFlatPlains(20, 12);
  r.at(2, 5).urbanLevel = 3;
  r.at(15, 5).urbanLevel = 2;
  r.at(8, 10).setSpecial(SpecialFeature::Castle);

  GenerationContext ctx;
  ctx.region = &r;
  ctx.seed = 5;

  GenerationConfig cfg;
  RoadStats stats;
  EXPECT_TRUE(GenerateRoads(ctx, cfg, &stats));
  EXPECT_EQ(stats.settlements, 3);
  EXPECT_TRUE(stats.roadEdges > 0);
  EXPECT_EQ(stats.pairsUnreachable, 0);

  // Every settlement ends up on the network.
  const EdgeCostFn roadOnly = [&r](int from, int, HexDirection dir) {
    return r.at(from).hasRoadThroughEdge(DirectionIndex(dir)) ? 1.0f : kImpassable;
  };
  std::vector<int> path;
  EXPECT_TRUE(FindPathAStar(r, r.indexOf(2, 5), r.indexOf(15, 5), roadOnly, path));
  EXPECT_TRUE(r.at(2, 5).hasRoads());
  EXPECT_TRUE(r.at(15, 5).hasRoads());
  EXPECT_TRUE(r.at(8, 10).hasRoads());
  EXPECT_TRUE(FindPathAStar(r, r.indexOf(2, 5), r.indexOf(8, 10), roadOnly, path));
}

void TestPathfindingFlatGrid()
{
  const RegionData r = MakeFlatPlains(10, 10);

  const PathResult same = FindPath(r, OffsetCoord{3, 3}, OffsetCoord{3, 3});
  EXPECT_TRUE(same.reachable);
  EXPECT_EQ(same.path.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(same.totalCost, 0.0f);

  const OffsetCoord from{0, 0};
  const OffsetCoord to{9, 9};
  const PathResult res = FindPath(r, from, to);
  ASSERT_TRUE(res.reachable);
  EXPECT_EQ(res.totalCost, static_cast<float>(HexDistance(from, to)));
  EXPECT_EQ(res.path.size(), static_cast<std::size_t>(HexDistance(from, to) + 1));
  EXPECT_TRUE(res.path.front() == from);
  EXPECT_TRUE(res.path.back() == to);
  EXPECT_EQ(PathCost(r, res.path, UnitType::Land), res.totalCost);
  for (std::size_t i = 1; i < res.path.size(); ++i) EXPECT_EQ(HexDistance(res.path[i - 1], res.path[i]), 1);

  // Same query twice yields the same path.
  const PathResult again = FindPath(r, from, to);
  EXPECT_TRUE(again.path == res.path);

  EXPECT_FALSE(FindPath(r, from, OffsetCoord{10, 0}).reachable);

  PathOptions tight;
  tight.maxCost = 5.0f;
  EXPECT_FALSE(FindPath(r, from, to, tight).reachable);

  PathOptions occupied;
  occupied.isOccupied = [](OffsetCoord c) { return c.x == 9 && c.z == 9; };
  EXPECT_FALSE(HasPath(r, from, to, occupied));
  occupied.ignoreUnits = true;
  EXPECT_TRUE(HasPath(r, from, to, occupied));

  EXPECT_EQ(GetStepCost(r, OffsetCoord{0, 0}, OffsetCoord{2, 0}, UnitType::Land), kImpassable);
}

void TestPathfindingObstacles()
{
  RegionData r = MakeFlatPlains(10, 10);
  for (int z = 0; z < 10; ++z) r.at(5, z).terrainTypeIndex = static_cast<int>(TerrainType::Mountains);

  EXPECT_FALSE(FindPath(r, OffsetCoord{0, 0}, OffsetCoord{9, 9}).reachable);
  EXPECT_FALSE(FindPath(r, OffsetCoord{0, 0}, OffsetCoord{5, 5}).reachable);

  // Open a pass with an uphill step.
  r.at(5, 4).terrainTypeIndex = static_cast<int>(TerrainType::Hills);
  r.at(5, 4).elevation = kLandMinElevation + 1;
  const PathResult res = FindPath(r, OffsetCoord{0, 4}, OffsetCoord{9, 4});
  ASSERT_TRUE(res.reachable);
  EXPECT_EQ(PathCost(r, res.path, UnitType::Land), res.totalCost);
  bool usesPass = false;
  for (const OffsetCoord& c : res.path) usesPass = usesPass || (c.x == 5 && c.z == 4);
  EXPECT_TRUE(usesPass);

  // Naval units cannot leave the water.
  EXPECT_FALSE(FindPath(r, OffsetCoord{0, 0}, OffsetCoord{1, 0}, PathOptions{UnitType::Naval}).reachable);
}

CellData MakeWaterCell(TerrainType t, int elevation)
{
  CellData c;
  c.elevation = elevation;
  c.waterLevel = kLandMinElevation;
  c.terrainTypeIndex = static_cast<int>(t);
  return c;
}

void TestLandUnitsStayOutOfWater()
{
  RegionData r = MakeFlatPlains(10, 10);
  for (int z = 0; z < 10; ++z) {
    CellData& c = r.at(5, z);
    c.elevation = kSeaLevel;
    c.waterLevel = kLandMinElevation;
    c.terrainTypeIndex = static_cast<int>(TerrainType::Coast);
  }

  const CellData& strip = r.at(5, 4);
  const CellData& shore = r.at(4, 4);
  EXPECT_TRUE(strip.isUnderwater());
  EXPECT_FALSE(IsPassable(UnitType::Land, strip));
  EXPECT_EQ(GetMovementCost(UnitType::Land, shore, strip), kImpassable);
  EXPECT_EQ(LandTerrainCost(TerrainType::Coast), kImpassable);

  EXPECT_FALSE(FindPath(r, OffsetCoord{0, 4}, OffsetCoord{9, 4}).reachable);
  EXPECT_FALSE(FindPath(r, OffsetCoord{0, 4}, OffsetCoord{5, 4}).reachable);

  PathOptions amph;
  amph.unitType = UnitType::Amphibious;
  const PathResult crossing = FindPath(r, OffsetCoord{0, 4}, OffsetCoord{9, 4}, amph);
  ASSERT_TRUE(crossing.reachable);
  EXPECT_EQ(PathCost(r, crossing.path, UnitType::Amphibious), crossing.totalCost);

  // Embark onto coast: naval 1.5 + 1. Disembark uphill: land 1.0 + 0.5 + 1.
  EXPECT_EQ(GetMovementCost(UnitType::Amphibious, shore, strip), 1.5f + kEmbarkCost);
  EXPECT_EQ(GetMovementCost(UnitType::Amphibious, strip, shore), 1.5f + kEmbarkCost);
  EXPECT_EQ(GetMovementCost(UnitType::Amphibious, shore, r.at(3, 4)), 1.0f);
}

void TestNavalAndAmphibiousCosts()
{
  const CellData ocean = MakeWaterCell(TerrainType::Ocean, 1);
  const CellData coast = MakeWaterCell(TerrainType::Coast, kSeaLevel);
  CellData plains;
  plains.elevation = kLandMinElevation;
  plains.waterLevel = kLandMinElevation;
  plains.terrainTypeIndex = static_cast<int>(TerrainType::Plains);
  CellData forest = plains;
  forest.terrainTypeIndex = static_cast<int>(TerrainType::Forest);

  EXPECT_EQ(GetMovementCost(UnitType::Naval, coast, ocean), 1.0f);
  EXPECT_EQ(GetMovementCost(UnitType::Naval, ocean, coast), 1.5f);
  EXPECT_EQ(GetMovementCost(UnitType::Naval, coast, plains), kImpassable);
  EXPECT_TRUE(IsPassable(UnitType::Naval, ocean));
  EXPECT_FALSE(IsPassable(UnitType::Naval, plains));

  // Amphibious takes the cheaper mode and pays only for crossing the shoreline.
  EXPECT_EQ(GetMovementCost(UnitType::Amphibious, coast, ocean), 1.0f);
  EXPECT_EQ(GetMovementCost(UnitType::Amphibious, plains, forest), 1.5f);
  EXPECT_EQ(GetMovementCost(UnitType::Amphibious, ocean, ocean), 1.0f);
  EXPECT_TRUE(IsPassable(UnitType::Amphibious, ocean));
  EXPECT_TRUE(IsPassable(UnitType::Amphibious, plains));
}

void TestReachableCells()
{
  const RegionData r = MakeFlatPlains(10, 10);
  const std::vector<ReachableCell> one = GetReachableCells(r, OffsetCoord{5, 5}, 1.0f);
  EXPECT_EQ(one.size(), static_cast<std::size_t>(7));

  const std::vector<ReachableCell> zero = GetReachableCells(r, OffsetCoord{5, 5}, 0.0f);
  ASSERT_TRUE(zero.size() == 1);
  EXPECT_EQ(zero[0].cost, 0.0f);

  for (const ReachableCell& c : GetReachableCells(r, OffsetCoord{5, 5}, 3.0f)) {
    EXPECT_EQ(c.cost, static_cast<float>(HexDistance(OffsetCoord{5, 5}, c.cell)));
  }
  EXPECT_TRUE(GetReachableCells(r, OffsetCoord{-1, 0}, 5.0f).empty());
}

void TestSerializeRoundTrip()
{
  RegionData r = GenerateSmall(31337, 30, 24);
  r.name = "Round Trip";
  r.generatedAtTicks = 638000000000000000LL;
  RegionConnection conn;
  conn.targetId = RegionId::Generate(7u);
  conn.targetName = "Neighbour";
  conn.departurePortIndex = 12;
  conn.arrivalPortIndex = 400;
  conn.travelTimeMinutes = 42.5f;
  conn.dangerLevel = 0.25f;
  r.connections.push_back(conn);

  std::vector<std::uint8_t> bytes;
  ASSERT_TRUE(SerializeRegion(r, bytes).ok());
  EXPECT_EQ(static_cast<std::uint64_t>(bytes.size()), EstimateRegionFileSize(r));

  RegionData back;
  const OpResult lr = DeserializeRegion(bytes.data(), bytes.size(), back);
  ASSERT_TRUE(lr.ok());
  EXPECT_EQ(back.width(), r.width());
  EXPECT_EQ(back.height(), r.height());
  EXPECT_EQ(back.name, r.name);
  EXPECT_TRUE(back.id == r.id);
  EXPECT_EQ(back.seed, r.seed);
  EXPECT_EQ(back.generatedAtTicks, r.generatedAtTicks);
  ASSERT_TRUE(back.connections.size() == 1);
  EXPECT_TRUE(back.connections[0] == conn);

  for (std::size_t i = 0; i < r.cellCount(); ++i) {
    EXPECT_TRUE(back.cells()[i] == UnpackCell(PackCell(r.cells()[i])));
  }

  std::vector<std::uint8_t> again;
  ASSERT_TRUE(SerializeRegion(back, again).ok());
  EXPECT_TRUE(again == bytes);
}

void TestDeserializeRejectsCorruptData()
{
  RegionData r = MakeFlatPlains(12, 10);
  r.name = "Corrupt";
  std::vector<std::uint8_t> good;
  ASSERT_TRUE(SerializeRegion(r, good).ok());

  RegionData target = MakeFlatPlains(3, 3);
  target.name = "keep";

  std::vector<std::uint8_t> bad = good;
  bad[0] ^= 0xFF;
  EXPECT_EQ(DeserializeRegion(bad.data(), bad.size(), target).status, OpStatus::ValidationFailed);
  EXPECT_EQ(target.name, std::string("keep"));
  EXPECT_EQ(target.width(), 3);

  bad = good;
  bad[4] = static_cast<std::uint8_t>(kRegionFileVersion + 1);
  const OpResult newer = DeserializeRegion(bad.data(), bad.size(), target);
  EXPECT_EQ(newer.status, OpStatus::ValidationFailed);
  EXPECT_FALSE(newer.message.empty());

  // Outgoing river direction 7 in the first cell record.
  bad = good;
  const std::size_t firstCell = good.size() - r.cellCount() * kPackedCellSize;
  bad[firstCell + 9] = static_cast<std::uint8_t>(bad[firstCell + 9] | (7u << 5));
  const OpResult badDir = DeserializeRegion(bad.data(), bad.size(), target);
  EXPECT_EQ(badDir.status, OpStatus::ValidationFailed);
  EXPECT_TRUE(badDir.message.find("river direction") != std::string::npos);

  bad = good;
  bad.pop_back();
  EXPECT_EQ(DeserializeRegion(bad.data(), bad.size(), target).status, OpStatus::ValidationFailed);

  bad = good;
  bad.push_back(0);
  EXPECT_EQ(DeserializeRegion(bad.data(), bad.size(), target).status, OpStatus::ValidationFailed);

  EXPECT_EQ(DeserializeRegion(good.data(), 10, target).status, OpStatus::ValidationFailed);
  EXPECT_EQ(target.name, std::string("keep"));

  EXPECT_TRUE(DeserializeRegion(good.data(), good.size(), target).ok());
  EXPECT_EQ(target.name, std::string("Corrupt"));

  // Older format versions still load.
  bad = good;
  bad[4] = 0;
  RegionData older;
  EXPECT_TRUE(DeserializeRegion(bad.data(), bad.size(), older).ok());
  EXPECT_EQ(older.width(), 12);
  EXPECT_EQ(older.name, std::string("Corrupt"));
}

void TestFileSizeForDefaultRegion()
{
  RegionParams params;
  params.name = "Default";
  params.seed = 42;
  EXPECT_EQ(params.width, 200);
  EXPECT_EQ(params.height, 200);

  RegionData r;
  ASSERT_TRUE(GenerateRegion(params, GenerationConfig{}, OperationContext{}, r).ok());
  EXPECT_TRUE(r.connections.empty());

  std::error_code ec;
  const fs::path dir = MakeTempPath("hexregion_size");
  fs::create_directories(dir, ec);
  const fs::path file = dir / (std::string("default") + kRegionFileExtension);
  ASSERT_TRUE(SaveRegion(r, file).ok());

  // header | name length + "Default" | seed | timestamp | connection count | cells
  const std::uint64_t expected = static_cast<std::uint64_t>(kRegionHeaderSize) + 4u + 7u + 4u + 8u + 4u +
                                 static_cast<std::uint64_t>(kDefaultRegionSize) * kDefaultRegionSize * kPackedCellSize;
  const std::uint64_t onDisk = static_cast<std::uint64_t>(fs::file_size(file, ec));
  EXPECT_FALSE(ec);
  EXPECT_EQ(onDisk, expected);
  EXPECT_EQ(EstimateRegionFileSize(r), expected);
  EXPECT_TRUE(onDisk >= 600000u && onDisk <= 1000000u);

  fs::remove_all(dir, ec);
}

void TestSaveLoadAndMetadata()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("hexregion_save");
  fs::create_directories(dir, ec);
  const fs::path file = dir / (std::string("isle") + kRegionFileExtension);

  RegionData r = GenerateSmall(8, 20, 16);
  r.name = "Isle";

  std::vector<std::string> stages;
  OperationContext op;
  op.progress = [&stages](const OperationProgress& p) { stages.push_back(p.stage); };
  ASSERT_TRUE(SaveRegion(r, file, op).ok());
  EXPECT_FALSE(stages.empty());
  EXPECT_EQ(stages.back(), std::string("Complete"));
  EXPECT_FALSE(fs::exists(fs::path(file.string() + ".tmp")));

  RegionMetadata meta;
  ASSERT_TRUE(ReadRegionMetadata(file, meta).ok());
  EXPECT_EQ(meta.name, std::string("Isle"));
  EXPECT_EQ(meta.width, 20);
  EXPECT_EQ(meta.height, 16);
  EXPECT_TRUE(meta.id == r.id);
  EXPECT_EQ(meta.fileSizeBytes, EstimateRegionFileSize(r));

  RegionData loaded;
  ASSERT_TRUE(LoadRegion(file, loaded).ok());
  EXPECT_EQ(loaded.width(), 20);
  EXPECT_EQ(loaded.name, std::string("Isle"));

  RegionData missing;
  EXPECT_EQ(LoadRegion(dir / "missing.region", missing).status, OpStatus::IoFailed);
  EXPECT_EQ(ReadRegionMetadata(dir / "missing.region", meta).status, OpStatus::IoFailed);

  // A file holding only a header still yields metadata errors, not a crash.
  {
    std::ofstream f(dir / "short.region", std::ios::binary);
    const char junk[8] = {'X', 'H', 'R', 'G', 1, 0, 0, 0};
    f.write(junk, sizeof(junk));
  }
  EXPECT_EQ(ReadRegionMetadata(dir / "short.region", meta).status, OpStatus::ValidationFailed);

  fs::remove_all(dir, ec);
}

void TestCancellation()
{
  RegionParams params;
  params.width = 60;
  params.height = 60;
  params.seed = 11;

  OperationContext pre;
  pre.cancel.cancel();
  RegionData region;
  EXPECT_EQ(GenerateRegion(params, GenerationConfig{}, pre, region).status, OpStatus::Cancelled);
  EXPECT_TRUE(region.empty());

  OperationContext mid;
  CancellationToken token = mid.cancel;
  mid.progress = [token](const OperationProgress& p) mutable {
    if (p.stage == "rivers") token.cancel();
  };
  EXPECT_EQ(GenerateRegion(params, GenerationConfig{}, mid, region).status, OpStatus::Cancelled);
  EXPECT_TRUE(region.empty());

  RegionData flat = MakeFlatPlains(10, 10);
  std::vector<std::uint8_t> bytes;
  OperationContext cancelled;
  cancelled.cancel.cancel();
  EXPECT_EQ(SerializeRegion(flat, bytes, cancelled).status, OpStatus::Cancelled);
}

void TestTaskRunnerBusy()
{
  RegionTaskRunner runner;

  std::promise<void> started;
  std::future<void> startedFuture = started.get_future();
  std::promise<void> gate;
  std::shared_future<void> gateFuture = gate.get_future().share();
  std::atomic<bool> first{true};

  OperationContext op;
  op.progress = [&](const OperationProgress&) {
    if (first.exchange(false)) {
      started.set_value();
      gateFuture.wait();
    }
  };

  RegionParams params;
  params.width = 50;
  params.height = 50;
  params.seed = 3;

  RegionData target;
  std::future<OpResult> running = runner.generate(params, GenerationConfig{}, op, target);
  startedFuture.wait();
  EXPECT_TRUE(runner.busy());

  RegionData other;
  std::future<OpResult> rejected = runner.load("does-not-matter.region", other, OperationContext{});
  EXPECT_EQ(rejected.get().status, OpStatus::Busy);

  gate.set_value();
  EXPECT_TRUE(running.get().ok());
  runner.wait();
  EXPECT_FALSE(runner.busy());
  EXPECT_EQ(target.width(), 50);

  // The runner accepts work again once idle.
  const fs::path file = MakeTempPath("hexregion_runner") += kRegionFileExtension;
  EXPECT_TRUE(runner.save(target, file, OperationContext{}).get().ok());
  std::error_code ec;
  fs::remove(file, ec);
}

void TestTaskRunnerCancel()
{
  RegionTaskRunner runner;

  std::promise<void> started;
  std::future<void> startedFuture = started.get_future();
  std::promise<void> gate;
  std::shared_future<void> gateFuture = gate.get_future().share();
  std::atomic<bool> first{true};

  OperationContext op;
  op.progress = [&](const OperationProgress&) {
    if (first.exchange(false)) {
      started.set_value();
      gateFuture.wait();
    }
  };

  RegionParams params;
  params.width = 80;
  params.height = 80;

  RegionData target;
  std::future<OpResult> running = runner.generate(params, GenerationConfig{}, op, target);
  startedFuture.wait();
  runner.cancel();
  gate.set_value();

  EXPECT_EQ(running.get().status, OpStatus::Cancelled);
  EXPECT_TRUE(target.empty());
}

void TestGridBridgeRoundTrip()
{
  const RegionData source = GenerateSmall(555, 32, 28);

  RegionData live;
  live.reset(32, 28);
  RegionGrid grid(live);
  std::string err;
  ASSERT_TRUE(ApplyRegionToGrid(source, grid, err));

  for (std::size_t i = 0; i < source.cellCount(); ++i) {
    const CellData& a = source.cells()[i];
    const CellData& b = live.cells()[i];
    EXPECT_EQ(a.elevation, b.elevation);
    EXPECT_EQ(a.waterLevel, b.waterLevel);
    EXPECT_EQ(a.terrainTypeIndex, b.terrainTypeIndex);
    EXPECT_EQ(a.urbanLevel, b.urbanLevel);
    EXPECT_EQ(a.specialIndex, b.specialIndex);
    EXPECT_EQ(a.hasOutgoingRiver, b.hasOutgoingRiver);
    if (a.hasOutgoingRiver) EXPECT_EQ(a.outgoingRiverDirection, b.outgoingRiverDirection);
    EXPECT_EQ(a.roadMask, b.roadMask);
  }

  RegionData snapshot;
  ASSERT_TRUE(ExtractRegionFromGrid(grid, "Snapshot", 555, snapshot, err));
  EXPECT_EQ(snapshot.name, std::string("Snapshot"));
  EXPECT_EQ(snapshot.width(), 32);
  EXPECT_TRUE(snapshot.cells() == live.cells());

  RegionData wrong;
  wrong.reset(10, 10);
  RegionGrid wrongGrid(wrong);
  EXPECT_FALSE(ApplyRegionToGrid(source, wrongGrid, err));
  EXPECT_FALSE(err.empty());
}

void TestJsonParse()
{
  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"a\": [1, 2.5, true, null], \"s\": \"caf\\u00e9 \\ud83d\\ude00\"}", v, err));
  ASSERT_TRUE(v.isObject());
  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a && a->isArray() && a->arrayValue.size() == 4);
  EXPECT_EQ(a->arrayValue[1].numberValue, 2.5);
  EXPECT_TRUE(a->arrayValue[3].isNull());
  const JsonValue* s = FindJsonMember(v, "s");
  ASSERT_TRUE(s && s->isString());
  EXPECT_EQ(s->stringValue, std::string("caf\xC3\xA9 \xF0\x9F\x98\x80"));

  EXPECT_FALSE(ParseJson("{\"a\": 1,}", v, err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(ParseJson("[1 2]", v, err));
  EXPECT_FALSE(ParseJson("\"\\ud800\"", v, err));

  JsonValue obj = JsonValue::MakeObject();
  obj.set("name", JsonValue::MakeString("a\"b"));
  obj.set("n", JsonValue::MakeNumber(3));
  EXPECT_EQ(JsonStringify(obj, -1), std::string("{\"name\":\"a\\\"b\",\"n\":3}"));
}

void TestGenerationConfigJson()
{
  GenerationConfig cfg;
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"land_fraction\": 0.3, \"roads_enabled\": false, \"max_river_length\": 40}", root, err));
  ASSERT_TRUE(ApplyGenerationConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.landFraction, 0.3f);
  EXPECT_FALSE(cfg.roadsEnabled);
  EXPECT_EQ(cfg.maxRiverLength, 40);
  EXPECT_EQ(cfg.terrainOctaves, GenerationConfig{}.terrainOctaves);

  ASSERT_TRUE(ParseJson("{\"max_river_length\": \"long\"}", root, err));
  EXPECT_FALSE(ApplyGenerationConfigJson(root, cfg, err));
  EXPECT_TRUE(err.find("max_river_length") != std::string::npos);
  EXPECT_EQ(cfg.maxRiverLength, 40);

  ASSERT_TRUE(ParseJson("{\"land_fraction\": 1.5}", root, err));
  EXPECT_FALSE(ApplyGenerationConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.landFraction, 0.3f);

  // Serialized config applies back onto defaults unchanged.
  GenerationConfig custom;
  custom.riverFraction = 0.125f;
  custom.featuresEnabled = false;
  custom.maxPartnersPerSettlement = 5;
  ASSERT_TRUE(ParseJson(GenerationConfigToJson(custom), root, err));
  GenerationConfig back;
  ASSERT_TRUE(ApplyGenerationConfigJson(root, back, err));
  EXPECT_EQ(back.riverFraction, 0.125f);
  EXPECT_FALSE(back.featuresEnabled);
  EXPECT_EQ(back.maxPartnersPerSettlement, 5);
  EXPECT_EQ(back.specialFeatureChance, custom.specialFeatureChance);

  std::error_code ec;
  const fs::path file = MakeTempPath("hexregion_cfg") += ".json";
  ASSERT_TRUE(WriteGenerationConfigJsonFile(file.string(), custom, err));
  GenerationConfig loaded;
  ASSERT_TRUE(LoadGenerationConfigJsonFile(file.string(), loaded, err));
  EXPECT_EQ(loaded.maxPartnersPerSettlement, 5);
  fs::remove(file, ec);
  EXPECT_FALSE(LoadGenerationConfigJsonFile(file.string(), loaded, err));
}

void TestLogLevels()
{
  LogLevel level = LogLevel::Info;
  EXPECT_TRUE(ParseLogLevel("WARN", level));
  EXPECT_EQ(level, LogLevel::Warn);
  EXPECT_TRUE(ParseLogLevel("debug", level));
  EXPECT_EQ(level, LogLevel::Debug);
  EXPECT_TRUE(ParseLogLevel("off", level));
  EXPECT_EQ(level, LogLevel::Off);
  EXPECT_FALSE(ParseLogLevel("loud", level));
  EXPECT_EQ(level, LogLevel::Off);

  const LogLevel saved = GetLogLevel();
  SetLogLevel(LogLevel::Error);
  EXPECT_FALSE(LogEnabled(LogLevel::Warn));
  EXPECT_TRUE(LogEnabled(LogLevel::Error));
  SetLogLevel(saved);
  EXPECT_EQ(std::string(LogLevelName(LogLevel::Info)), std::string("info"));
}

void TestLogRotation()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("hexregion_log");
  fs::create_directories(dir, ec);
  const fs::path base = dir / "run.log";

  { std::ofstream(base) << "first\n"; }
  std::string err;
  EXPECT_TRUE(LogTee::Rotate(base, 2, err));
  EXPECT_FALSE(fs::exists(base));
  EXPECT_TRUE(fs::exists(fs::path(base.string() + ".1")));

  { std::ofstream(base) << "second\n"; }
  EXPECT_TRUE(LogTee::Rotate(base, 2, err));
  EXPECT_TRUE(fs::exists(fs::path(base.string() + ".2")));

  fs::remove_all(dir, ec);
}

void TestLogTeeCapturesStderr()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("hexregion_tee");
  fs::create_directories(dir, ec);
  const fs::path file = dir / "tee.log";

  std::streambuf* const consoleErr = std::cerr.rdbuf();
  {
    LogTee tee;
    EXPECT_FALSE(tee.active());

    LogTeeOptions opt;
    opt.path = file;
    opt.keepFiles = 0;
    opt.teeStdout = false;
    std::string err;
    EXPECT_TRUE(tee.start(opt, err));
    EXPECT_TRUE(tee.active());
    std::cerr << "tee check line\n";
    tee.stop();
    EXPECT_FALSE(tee.active());
    EXPECT_TRUE(std::cerr.rdbuf() == consoleErr);

    LogTeeOptions empty;
    EXPECT_FALSE(tee.start(empty, err));
    EXPECT_FALSE(err.empty());
  }

  std::ifstream in(file, std::ios::binary);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_TRUE(text.find("[ERR] tee check line") != std::string::npos);
  in.close();

  fs::remove_all(dir, ec);
}

} // namespace

int main()
{
  // Keep test output readable.
  SetLogLevel(LogLevel::Warn);

  TestHexNeighborsAndDistance();
  TestWorldPositionAndTerraces();
  TestPackedCellBoundaries();
  TestCellRiverAndRoadRules();
  TestRegionIdFormat();

  TestLandThreshold();
  TestGenerationDeterministic();
  TestSeed42HasLandAndWater();
  TestGenerateRegionRejectsBadSize();
  TestClimateRules();
  TestRiversFlowDownhill();
  TestRiverSourceFitness();
  TestFeaturesAvoidWaterAndRivers();
  TestRoadsSymmetricAndLegal();
  TestApplyRoadPathAndCosts();
  TestRoadsBesideRiverEdges();
  TestSettlementDetection();
  TestRoadsConnectSettlements();

  TestPathfindingFlatGrid();
  TestPathfindingObstacles();
  TestLandUnitsStayOutOfWater();
  TestNavalAndAmphibiousCosts();
  TestReachableCells();

  TestSerializeRoundTrip();
  TestDeserializeRejectsCorruptData();
  TestFileSizeForDefaultRegion();
  TestSaveLoadAndMetadata();

  TestCancellation();
  TestTaskRunnerBusy();
  TestTaskRunnerCancel();
  TestGridBridgeRoundTrip();

  TestJsonParse();
  TestGenerationConfigJson();
  TestLogLevels();
  TestLogRotation();
  TestLogTeeCapturesStderr();

  if (g_failures == 0) {
    std::cout << "hexregion_tests: OK\n";
    return 0;
  }

  std::cerr << "hexregion_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
