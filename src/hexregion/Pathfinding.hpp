#pragma once

#include "hexregion/HexMetrics.hpp"
#include "hexregion/MovementCost.hpp"
#include "hexregion/Operation.hpp"
#include "hexregion/Region.hpp"

#include <functional>
#include <vector>

namespace hexregion {

// -----------------------------------------------------------------------------
// Generic grid search
//
// Both searches operate on cell indices (z*width + x) and take the edge cost as
// a callback so the road generator and unit movement share one implementation.
// A callback result of kImpassable (or any non-finite / negative value) blocks
// the edge.
//
// Determinism: among queue entries with equal priority, the one pushed first is
// expanded first.
// -----------------------------------------------------------------------------

using EdgeCostFn = std::function<float(int fromIndex, int toIndex, HexDirection dir)>;

// A* from start to goal with h = hex distance * heuristicScale. heuristicScale
// must not exceed the cheapest possible edge cost for the result to be optimal.
//
// Returns true and fills outPath (start..goal inclusive) when the goal is
// reachable with total cost <= maxCost.
bool FindPathAStar(const RegionData& region, int startIndex, int goalIndex, const EdgeCostFn& edgeCost,
                   std::vector<int>& outPath, float* outCost = nullptr, float maxCost = kImpassable,
                   float heuristicScale = 1.0f, const CancellationToken* cancel = nullptr);

// Dijkstra flood from start: every cell reachable within budget and its cost.
// Results are ordered by index. The start cell is included with cost 0.
struct CostedCell {
  int index = -1;
  float cost = 0.0f;
};

void ExploreReachable(const RegionData& region, int startIndex, const EdgeCostFn& edgeCost, float budget,
                      std::vector<CostedCell>& outCells);

// -----------------------------------------------------------------------------
// Unit movement queries
// -----------------------------------------------------------------------------

using OccupancyFn = std::function<bool(OffsetCoord cell)>;

struct PathOptions {
  UnitType unitType = UnitType::Land;

  // Skip occupancy checks entirely.
  bool ignoreUnits = false;

  // Prune everything more expensive than this.
  float maxCost = kImpassable;

  // Supplied by the unit manager; occupied cells cannot be entered.
  OccupancyFn isOccupied;

  // Optional cooperative cancellation for very large grids.
  const CancellationToken* cancel = nullptr;
};

struct PathResult {
  bool reachable = false;
  bool cancelled = false;
  std::vector<OffsetCoord> path; // start..goal inclusive
  float totalCost = kImpassable;

  static PathResult NotReachable() { return PathResult{}; }
};

PathResult FindPath(const RegionData& region, OffsetCoord start, OffsetCoord goal, const PathOptions& opt = {});

bool HasPath(const RegionData& region, OffsetCoord start, OffsetCoord goal, const PathOptions& opt = {});

struct ReachableCell {
  OffsetCoord cell;
  float cost = 0.0f;
};

// Every cell the unit can reach from start spending at most budget.
std::vector<ReachableCell> GetReachableCells(const RegionData& region, OffsetCoord start, float budget,
                                             const PathOptions& opt = {});

// Cost of a single step between adjacent cells (kImpassable if not adjacent,
// out of bounds, or forbidden for the unit).
float GetStepCost(const RegionData& region, OffsetCoord from, OffsetCoord to, UnitType unit);

// Sum of GetStepCost along a path (kImpassable if any step is forbidden).
float PathCost(const RegionData& region, const std::vector<OffsetCoord>& path, UnitType unit);

} // namespace hexregion
