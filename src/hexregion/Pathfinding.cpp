#include "hexregion/Pathfinding.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <queue>

namespace hexregion {

namespace {

struct Node {
  int idx = 0;
  float f = 0.0f;
  float g = 0.0f;
  std::uint64_t seq = 0; // push order; earlier wins among equal f
};

struct Cmp {
  bool operator()(const Node& a, const Node& b) const
  {
    if (a.f != b.f) return a.f > b.f;
    return a.seq > b.seq;
  }
};

using OpenQueue = std::priority_queue<Node, std::vector<Node>, Cmp>;

inline bool IsUsableCost(float c) { return std::isfinite(c) && c >= 0.0f; }

void ReconstructPath(int goalIdx, int startIdx, const std::vector<int>& cameFrom, std::vector<int>& out)
{
  out.clear();
  int cur = goalIdx;
  while (cur != -1) {
    out.push_back(cur);
    if (cur == startIdx) break;
    cur = cameFrom[static_cast<std::size_t>(cur)];
  }
  std::reverse(out.begin(), out.end());
}

// Edge cost for unit movement, including occupancy.
EdgeCostFn UnitEdgeCost(const RegionData& region, const PathOptions& opt)
{
  return [&region, &opt](int from, int to, HexDirection) -> float {
    const CellData& a = region.at(from);
    const CellData& b = region.at(to);
    if (!opt.ignoreUnits && opt.isOccupied && opt.isOccupied(b.coord())) return kImpassable;
    return GetMovementCost(opt.unitType, a, b);
  };
}

} // namespace

bool FindPathAStar(const RegionData& region, int startIndex, int goalIndex, const EdgeCostFn& edgeCost,
                   std::vector<int>& outPath, float* outCost, float maxCost, float heuristicScale,
                   const CancellationToken* cancel)
{
  outPath.clear();
  if (outCost) *outCost = kImpassable;

  const int n = static_cast<int>(region.cellCount());
  if (n <= 0 || !edgeCost) return false;
  if (startIndex < 0 || startIndex >= n || goalIndex < 0 || goalIndex >= n) return false;

  if (startIndex == goalIndex) {
    outPath.push_back(startIndex);
    if (outCost) *outCost = 0.0f;
    return true;
  }

  const OffsetCoord goal = region.coordOf(goalIndex);
  auto heuristic = [&](int idx) -> float {
    return static_cast<float>(HexDistance(region.coordOf(idx), goal)) * heuristicScale;
  };

  std::vector<int> cameFrom(static_cast<std::size_t>(n), -1);
  std::vector<float> gScore(static_cast<std::size_t>(n), kImpassable);
  std::vector<std::uint8_t> closed(static_cast<std::size_t>(n), 0);

  OpenQueue open;
  std::uint64_t seq = 0;

  gScore[static_cast<std::size_t>(startIndex)] = 0.0f;
  open.push(Node{startIndex, heuristic(startIndex), 0.0f, seq++});

  std::uint32_t pops = 0;
  while (!open.empty()) {
    const Node cur = open.top();
    open.pop();

    if ((++pops & 0x3FFu) == 0u && cancel && cancel->cancelled()) return false;

    const std::size_t ucur = static_cast<std::size_t>(cur.idx);
    // Ignore stale heap entries.
    if (closed[ucur] || cur.g != gScore[ucur]) continue;
    closed[ucur] = 1;

    if (cur.idx == goalIndex) {
      ReconstructPath(goalIndex, startIndex, cameFrom, outPath);
      if (outCost) *outCost = cur.g;
      return true;
    }

    for (int d = 0; d < kHexDirectionCount; ++d) {
      const HexDirection dir = static_cast<HexDirection>(d);
      const int nidx = region.neighborIndex(cur.idx, dir);
      if (nidx < 0) continue;
      const std::size_t unidx = static_cast<std::size_t>(nidx);
      if (closed[unidx]) continue;

      const float step = edgeCost(cur.idx, nidx, dir);
      if (!IsUsableCost(step)) continue;

      const float tentative = cur.g + step;
      if (tentative > maxCost) continue;
      if (tentative < gScore[unidx]) {
        gScore[unidx] = tentative;
        cameFrom[unidx] = cur.idx;
        open.push(Node{nidx, tentative + heuristic(nidx), tentative, seq++});
      }
    }
  }

  return false;
}

void ExploreReachable(const RegionData& region, int startIndex, const EdgeCostFn& edgeCost, float budget,
                      std::vector<CostedCell>& outCells)
{
  outCells.clear();
  const int n = static_cast<int>(region.cellCount());
  if (n <= 0 || !edgeCost || startIndex < 0 || startIndex >= n || budget < 0.0f) return;

  std::vector<float> dist(static_cast<std::size_t>(n), kImpassable);
  std::vector<std::uint8_t> done(static_cast<std::size_t>(n), 0);

  OpenQueue open;
  std::uint64_t seq = 0;
  dist[static_cast<std::size_t>(startIndex)] = 0.0f;
  open.push(Node{startIndex, 0.0f, 0.0f, seq++});

  while (!open.empty()) {
    const Node cur = open.top();
    open.pop();

    const std::size_t ucur = static_cast<std::size_t>(cur.idx);
    if (done[ucur] || cur.g != dist[ucur]) continue;
    done[ucur] = 1;

    for (int d = 0; d < kHexDirectionCount; ++d) {
      const HexDirection dir = static_cast<HexDirection>(d);
      const int nidx = region.neighborIndex(cur.idx, dir);
      if (nidx < 0) continue;
      const std::size_t unidx = static_cast<std::size_t>(nidx);
      if (done[unidx]) continue;

      const float step = edgeCost(cur.idx, nidx, dir);
      if (!IsUsableCost(step)) continue;

      const float nd = cur.g + step;
      if (nd > budget) continue;
      if (nd < dist[unidx]) {
        dist[unidx] = nd;
        open.push(Node{nidx, nd, nd, seq++});
      }
    }
  }

  for (int i = 0; i < n; ++i) {
    if (done[static_cast<std::size_t>(i)]) outCells.push_back(CostedCell{i, dist[static_cast<std::size_t>(i)]});
  }
}

PathResult FindPath(const RegionData& region, OffsetCoord start, OffsetCoord goal, const PathOptions& opt)
{
  if (!region.inBounds(start) || !region.inBounds(goal)) return PathResult::NotReachable();

  if (start == goal) {
    PathResult r;
    r.reachable = true;
    r.path.push_back(start);
    r.totalCost = 0.0f;
    return r;
  }

  const CellData& goalCell = region.at(goal.x, goal.z);
  if (!IsPassable(opt.unitType, goalCell)) return PathResult::NotReachable();
  if (!opt.ignoreUnits && opt.isOccupied && opt.isOccupied(goal)) return PathResult::NotReachable();

  std::vector<int> indices;
  float cost = kImpassable;
  const bool found = FindPathAStar(region, region.indexOf(start), region.indexOf(goal), UnitEdgeCost(region, opt),
                                   indices, &cost, opt.maxCost, 1.0f, opt.cancel);
  if (!found) {
    PathResult r = PathResult::NotReachable();
    r.cancelled = (opt.cancel && opt.cancel->cancelled());
    return r;
  }

  PathResult r;
  r.reachable = true;
  r.totalCost = cost;
  r.path.reserve(indices.size());
  for (int idx : indices) r.path.push_back(region.coordOf(idx));
  return r;
}

bool HasPath(const RegionData& region, OffsetCoord start, OffsetCoord goal, const PathOptions& opt)
{
  return FindPath(region, start, goal, opt).reachable;
}

std::vector<ReachableCell> GetReachableCells(const RegionData& region, OffsetCoord start, float budget,
                                             const PathOptions& opt)
{
  std::vector<ReachableCell> out;
  if (!region.inBounds(start)) return out;

  std::vector<CostedCell> cells;
  ExploreReachable(region, region.indexOf(start), UnitEdgeCost(region, opt), budget, cells);

  out.reserve(cells.size());
  for (const CostedCell& c : cells) out.push_back(ReachableCell{region.coordOf(c.index), c.cost});
  return out;
}

float GetStepCost(const RegionData& region, OffsetCoord from, OffsetCoord to, UnitType unit)
{
  if (!region.inBounds(from) || !region.inBounds(to)) return kImpassable;
  if (DirectionBetween(from, to) < 0) return kImpassable;
  return GetMovementCost(unit, region.at(from.x, from.z), region.at(to.x, to.z));
}

float PathCost(const RegionData& region, const std::vector<OffsetCoord>& path, UnitType unit)
{
  float total = 0.0f;
  for (std::size_t i = 1; i < path.size(); ++i) {
    const float c = GetStepCost(region, path[i - 1], path[i], unit);
    if (!IsUsableCost(c)) return kImpassable;
    total += c;
  }
  return total;
}

} // namespace hexregion
