#include "hexregion/RoadGenerator.hpp"

#include "hexregion/Pathfinding.hpp"
#include "hexregion/Random.hpp"
#include "hexregion/Region.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <numeric>
#include <utility>

namespace hexregion {

namespace {

struct SettlementPair {
  int a = 0; // settlement ordinals, a < b
  int b = 0;
  int distance = 0;
  int importance = 0;
  std::uint64_t tie = 0;
};

struct UnionFind {
  std::vector<int> parent;

  explicit UnionFind(int n) : parent(static_cast<std::size_t>(n)) { std::iota(parent.begin(), parent.end(), 0); }

  int find(int x)
  {
    while (parent[static_cast<std::size_t>(x)] != x) {
      parent[static_cast<std::size_t>(x)] = parent[static_cast<std::size_t>(parent[static_cast<std::size_t>(x)])];
      x = parent[static_cast<std::size_t>(x)];
    }
    return x;
  }

  void unite(int a, int b)
  {
    a = find(a);
    b = find(b);
    if (a == b) return;
    // Smaller root wins so the structure does not depend on call order.
    if (b < a) std::swap(a, b);
    parent[static_cast<std::size_t>(b)] = a;
  }
};

static int Importance(const CellData& c)
{
  const SpecialFeature s = c.special();
  const int bonus = (s == SpecialFeature::Castle || s == SpecialFeature::Ziggurat) ? 2 : 0;
  return c.urbanLevel + bonus;
}

static std::vector<SettlementPair> BuildCandidatePairs(const RegionData& region, const std::vector<int>& settlements,
                                                       const GenerationConfig& cfg, RNG& rng)
{
  const int n = static_cast<int>(settlements.size());
  const int keep = std::max(1, cfg.maxPartnersPerSettlement);

  std::vector<std::pair<int, int>> keys; // (a, b) with a < b
  std::vector<std::pair<int, int>> near; // (distance, ordinal)
  for (int i = 0; i < n; ++i) {
    const OffsetCoord ci = region.coordOf(settlements[static_cast<std::size_t>(i)]);
    near.clear();
    for (int j = 0; j < n; ++j) {
      if (j == i) continue;
      const int d = HexDistance(ci, region.coordOf(settlements[static_cast<std::size_t>(j)]));
      if (d > cfg.maxSettlementDistance) continue;
      near.emplace_back(d, j);
    }
    std::sort(near.begin(), near.end());
    const std::size_t count = std::min(near.size(), static_cast<std::size_t>(keep));
    for (std::size_t k = 0; k < count; ++k) {
      const int j = near[k].second;
      keys.emplace_back(std::min(i, j), std::max(i, j));
    }
  }

  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

  std::vector<SettlementPair> pairs;
  pairs.reserve(keys.size());
  for (const auto& k : keys) {
    const int ia = settlements[static_cast<std::size_t>(k.first)];
    const int ib = settlements[static_cast<std::size_t>(k.second)];
    SettlementPair p;
    p.a = k.first;
    p.b = k.second;
    p.distance = HexDistance(region.coordOf(ia), region.coordOf(ib));
    p.importance = Importance(region.at(ia)) + Importance(region.at(ib));
    p.tie = rng.nextU64();
    pairs.push_back(p);
  }

  std::sort(pairs.begin(), pairs.end(), [](const SettlementPair& x, const SettlementPair& y) {
    if (x.distance != y.distance) return x.distance < y.distance;
    if (x.importance != y.importance) return x.importance > y.importance;
    if (x.tie != y.tie) return x.tie < y.tie;
    if (x.a != y.a) return x.a < y.a;
    return x.b < y.b;
  });
  return pairs;
}

} // namespace

bool IsSettlement(const CellData& c, const GenerationConfig& cfg)
{
  if (c.isUnderwater() || c.isMegaflora()) return false;
  const SpecialFeature s = c.special();
  return c.urbanLevel >= cfg.settlementUrbanThreshold || s == SpecialFeature::Castle || s == SpecialFeature::Ziggurat;
}

std::vector<int> FindSettlements(const RegionData& region, const GenerationConfig& cfg)
{
  std::vector<int> out;
  for (int i = 0; i < static_cast<int>(region.cellCount()); ++i) {
    if (IsSettlement(region.at(i), cfg)) out.push_back(i);
  }
  return out;
}

bool CanPlaceRoad(const RegionData& region, int fromIndex, HexDirection dir)
{
  const int toIndex = region.neighborIndex(fromIndex, dir);
  if (toIndex < 0) return false;

  const CellData& a = region.at(fromIndex);
  const CellData& b = region.at(toIndex);
  if (a.isUnderwater() || b.isUnderwater()) return false;
  if (a.isMegaflora() || b.isMegaflora()) return false;
  if (std::abs(a.elevation - b.elevation) > 1) return false;

  const int d = DirectionIndex(dir);
  if (a.hasRiverThroughEdge(d) || b.hasRiverThroughEdge(DirectionIndex(Opposite(dir)))) return false;
  return true;
}

float RoadStepCost(const RegionData& region, int fromIndex, int toIndex, HexDirection dir)
{
  if (!CanPlaceRoad(region, fromIndex, dir)) return kImpassable;
  const CellData& a = region.at(fromIndex);
  if (a.hasRoadThroughEdge(DirectionIndex(dir))) return 1.0f;

  const CellData& b = region.at(toIndex);
  float cost = 1.0f + 2.0f * static_cast<float>(std::abs(a.elevation - b.elevation));
  if (a.hasRiver() || b.hasRiver()) cost += 1.0f;
  return cost;
}

int ApplyRoadPath(RegionData& region, const std::vector<int>& path)
{
  int added = 0;
  for (std::size_t i = 1; i < path.size(); ++i) {
    const int from = path[i - 1];
    const int to = path[i];
    const int d = DirectionBetween(region.coordOf(from), region.coordOf(to));
    if (d < 0) continue;
    CellData& a = region.at(from);
    if (!a.hasRoadThroughEdge(d)) ++added;
    a.setRoad(d, true);
    region.at(to).setRoad(DirectionIndex(Opposite(static_cast<HexDirection>(d))), true);
  }
  return added;
}

// Pairing: candidate pairs are each settlement's nearest partners within
// maxSettlementDistance, tried in order of (distance, combined importance desc,
// seeded tie key, ordinals). A pair whose endpoints already share a road
// component is skipped, so each component grows a spanning network plus the
// short links that were cheaper than detours.
bool GenerateRoads(GenerationContext& ctx, const GenerationConfig& cfg, RoadStats* outStats)
{
  RoadStats stats;
  if (!ctx.region) {
    if (outStats) *outStats = stats;
    return true;
  }
  RegionData& region = *ctx.region;

  const std::vector<int> settlements = FindSettlements(region, cfg);
  stats.settlements = static_cast<int>(settlements.size());

  RNG rng(PassSeed(ctx.seed, kRoadSeedOffset));
  const std::vector<SettlementPair> pairs = BuildCandidatePairs(region, settlements, cfg, rng);
  stats.candidatePairs = static_cast<int>(pairs.size());

  std::vector<int> ordinalOf(region.cellCount(), -1);
  for (std::size_t i = 0; i < settlements.size(); ++i) {
    ordinalOf[static_cast<std::size_t>(settlements[i])] = static_cast<int>(i);
  }

  UnionFind components(stats.settlements);
  const EdgeCostFn cost = [&region](int from, int to, HexDirection dir) {
    return RoadStepCost(region, from, to, dir);
  };
  const float maxCost = 4.0f * static_cast<float>(std::max(1, cfg.maxRoadPathLength));

  std::vector<int> path;
  for (const SettlementPair& p : pairs) {
    if (ctx.cancelled()) {
      if (outStats) *outStats = stats;
      return false;
    }
    if (components.find(p.a) == components.find(p.b)) {
      ++stats.pairsAlreadyConnected;
      continue;
    }

    const int from = settlements[static_cast<std::size_t>(p.a)];
    const int to = settlements[static_cast<std::size_t>(p.b)];
    const bool found = FindPathAStar(region, from, to, cost, path, nullptr, maxCost, 1.0f, &ctx.op.cancel);
    if (!found) {
      if (ctx.cancelled()) {
        if (outStats) *outStats = stats;
        return false;
      }
      ++stats.pairsUnreachable;
      continue;
    }
    if (static_cast<int>(path.size()) > cfg.maxRoadPathLength) {
      ++stats.pairsUnreachable;
      continue;
    }

    stats.roadEdges += ApplyRoadPath(region, path);
    ++stats.pairsConnected;
    for (int idx : path) {
      const int ord = ordinalOf[static_cast<std::size_t>(idx)];
      if (ord >= 0) components.unite(p.a, ord);
    }
  }

  if (outStats) *outStats = stats;
  return true;
}

} // namespace hexregion
