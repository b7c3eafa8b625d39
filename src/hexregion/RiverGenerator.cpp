#include "hexregion/RiverGenerator.hpp"

#include "hexregion/HexMetrics.hpp"
#include "hexregion/Random.hpp"
#include "hexregion/Region.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace hexregion {

namespace {

// The cell itself or any neighbor is water or already carries a river.
static bool NearWaterOrRiver(const RegionData& region, int index)
{
  if (region.at(index).hasRiver()) return true;
  for (int d = 0; d < kHexDirectionCount; ++d) {
    const int n = region.neighborIndex(index, static_cast<HexDirection>(d));
    if (n < 0) continue;
    const CellData& nc = region.at(n);
    if (nc.isUnderwater() || nc.hasRiver()) return true;
  }
  return false;
}

static float SourceWeight(float fitness, const GenerationConfig& cfg)
{
  if (fitness >= cfg.weightedHighThreshold) return cfg.weightHigh;
  if (fitness >= cfg.weightedMediumThreshold) return cfg.weightMedium;
  return cfg.weightLow;
}

struct Trace {
  std::vector<int> cells; // source first
  std::vector<int> dirs;  // dirs[i] leads from cells[i] to cells[i + 1]
};

static void TraceRiver(const RegionData& region, int source, const GenerationConfig& cfg, RNG& rng, Trace& out)
{
  out.cells.clear();
  out.dirs.clear();
  out.cells.push_back(source);

  std::vector<int> candDirs;
  std::vector<float> candWeights;

  int cur = source;
  while (static_cast<int>(out.dirs.size()) < cfg.maxRiverLength) {
    const int curElevation = region.at(cur).elevation;

    candDirs.clear();
    candWeights.clear();
    for (int d = 0; d < kHexDirectionCount; ++d) {
      const int n = region.neighborIndex(cur, static_cast<HexDirection>(d));
      if (n < 0) continue;
      const int drop = curElevation - region.at(n).elevation;
      if (drop <= 0) continue;
      candDirs.push_back(d);
      candWeights.push_back(1.0f + cfg.riverSteepnessWeight * static_cast<float>(drop));
    }

    const int pick = rng.pickWeighted(candWeights);
    if (pick < 0) break; // pit

    const int dir = candDirs[static_cast<std::size_t>(pick)];
    const int next = region.neighborIndex(cur, static_cast<HexDirection>(dir));
    if (std::find(out.cells.begin(), out.cells.end(), next) != out.cells.end()) break;

    out.cells.push_back(next);
    out.dirs.push_back(dir);

    const CellData& nc = region.at(next);
    if (nc.isUnderwater() || nc.hasRiver()) break;
    cur = next;
  }
}

static void CommitRiver(RegionData& region, const Trace& t)
{
  for (std::size_t i = 0; i < t.dirs.size(); ++i) {
    const int dir = t.dirs[i];
    region.at(t.cells[i]).setOutgoingRiver(dir);

    // A merge keeps whichever river reached the cell first as its inflow.
    CellData& next = region.at(t.cells[i + 1]);
    if (!next.hasIncomingRiver) next.setIncomingRiver(DirectionIndex(Opposite(static_cast<HexDirection>(dir))));
  }
}

} // namespace

float RiverSourceFitness(const CellData& c)
{
  const float height = static_cast<float>(c.elevation - kSeaLevel) / static_cast<float>(kMaxElevation - kSeaLevel);
  return c.moisture * std::clamp(height, 0.0f, 1.0f);
}

bool GenerateRivers(GenerationContext& ctx, const GenerationConfig& cfg, RiverStats* outStats)
{
  RiverStats stats;
  if (!ctx.region) {
    if (outStats) *outStats = stats;
    return true;
  }
  RegionData& region = *ctx.region;

  const int landCells = region.landCellCount();
  int budget = static_cast<int>(std::floor(static_cast<double>(landCells) * static_cast<double>(cfg.riverFraction)));
  stats.budget = std::max(0, budget);
  budget = stats.budget;

  std::vector<int> sources;
  std::vector<float> weights;
  for (int i = 0; i < static_cast<int>(region.cellCount()); ++i) {
    const CellData& c = region.at(i);
    if (c.isUnderwater()) continue;
    if (NearWaterOrRiver(region, i)) continue;
    const float fitness = RiverSourceFitness(c);
    if (fitness < cfg.riverSourceMinFitness) continue;
    sources.push_back(i);
    weights.push_back(SourceWeight(fitness, cfg));
  }
  stats.sourceCandidates = static_cast<int>(sources.size());

  RNG rng(PassSeed(ctx.seed, kRiverSeedOffset));
  const int maxAttempts = 2 * stats.sourceCandidates;
  const int minEdges = std::max(1, cfg.minRiverLength);

  Trace trace;
  while (budget > 0 && !sources.empty() && stats.attempts < maxAttempts) {
    if (ctx.cancelled()) {
      if (outStats) *outStats = stats;
      return false;
    }
    ++stats.attempts;

    const int pick = rng.pickWeighted(weights);
    if (pick < 0) break;

    const std::size_t upick = static_cast<std::size_t>(pick);
    const int source = sources[upick];
    sources.erase(sources.begin() + static_cast<std::ptrdiff_t>(upick));
    weights.erase(weights.begin() + static_cast<std::ptrdiff_t>(upick));

    // Earlier rivers may have reached this source since the list was built.
    if (NearWaterOrRiver(region, source)) continue;

    TraceRiver(region, source, cfg, rng, trace);
    const int edges = static_cast<int>(trace.dirs.size());
    if (edges < minEdges) {
      ++stats.tracesDiscarded;
      continue;
    }

    CommitRiver(region, trace);
    ++stats.riversCommitted;
    stats.segmentsCommitted += edges;
    budget -= edges;
  }

  if (outStats) *outStats = stats;
  return true;
}

} // namespace hexregion
