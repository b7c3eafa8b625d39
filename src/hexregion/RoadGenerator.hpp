#pragma once

#include "hexregion/Cell.hpp"
#include "hexregion/GenerationConfig.hpp"
#include "hexregion/HexMetrics.hpp"
#include "hexregion/Operation.hpp"

#include <vector>

namespace hexregion {

class RegionData;

struct RoadStats {
  int settlements = 0;
  int candidatePairs = 0;
  int pairsConnected = 0;
  int pairsAlreadyConnected = 0;
  int pairsUnreachable = 0; // no path, or path longer than maxRoadPathLength
  int roadEdges = 0;        // undirected edges added
};

// Urban level at or above the threshold, or a castle/ziggurat. Underwater and
// megaflora cells never qualify.
bool IsSettlement(const CellData& c, const GenerationConfig& cfg);

// Settlement cell indices in index order.
std::vector<int> FindSettlements(const RegionData& region, const GenerationConfig& cfg);

// Whether a road may join cell `fromIndex` to its neighbor in direction `dir`.
//
// Blocked by: missing neighbor, underwater or megaflora endpoints, an elevation
// step above 1, or a river flowing through the shared edge. Other edges of a
// river cell stay open, so roads can bridge or skirt the river.
bool CanPlaceRoad(const RegionData& region, int fromIndex, HexDirection dir);

// A* edge cost for road building: 1 along an existing road, otherwise
// 1 + 2*|elevation step| + 1 if either endpoint has a river. kImpassable when
// CanPlaceRoad fails.
float RoadStepCost(const RegionData& region, int fromIndex, int toIndex, HexDirection dir);

// Sets the road bit in both directions for each consecutive pair of the path.
// Returns the number of edges that were not already roads.
int ApplyRoadPath(RegionData& region, const std::vector<int>& path);

// Connects settlements pairwise, shortest pairs first (see RoadGenerator.cpp).
//
// Returns false if the operation was cancelled.
bool GenerateRoads(GenerationContext& ctx, const GenerationConfig& cfg, RoadStats* outStats = nullptr);

} // namespace hexregion
