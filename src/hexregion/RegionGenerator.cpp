#include "hexregion/RegionGenerator.hpp"

#include "hexregion/ClimateGenerator.hpp"
#include "hexregion/FeatureGenerator.hpp"
#include "hexregion/LandGenerator.hpp"
#include "hexregion/Log.hpp"
#include "hexregion/Random.hpp"

#include <chrono>
#include <utility>

namespace hexregion {

OpResult RunGenerationPasses(GenerationContext& ctx, const GenerationConfig& cfg, GenerationReport* outReport)
{
  GenerationReport report;
  if (!ctx.region) return OpResult::Failure(OpStatus::ValidationFailed, "No region to generate into");

  const auto t0 = std::chrono::steady_clock::now();
  const OperationContext& op = ctx.op;

  op.report("land", 0.0f);
  if (!GenerateLand(ctx, cfg)) return OpResult::Cancel();

  if (ctx.cancelled()) return OpResult::Cancel();
  op.report("climate", 0.25f);
  if (!GenerateClimate(ctx, cfg)) return OpResult::Cancel();

  if (ctx.cancelled()) return OpResult::Cancel();
  op.report("rivers", 0.45f);
  if (!GenerateRivers(ctx, cfg, &report.rivers)) return OpResult::Cancel();

  if (ctx.cancelled()) return OpResult::Cancel();
  op.report("features", 0.65f);
  if (cfg.featuresEnabled && !GenerateFeatures(ctx, cfg)) return OpResult::Cancel();

  if (ctx.cancelled()) return OpResult::Cancel();
  op.report("roads", 0.8f);
  if (cfg.roadsEnabled && !GenerateRoads(ctx, cfg, &report.roads)) return OpResult::Cancel();

  const RegionData& region = *ctx.region;
  report.landCells = region.landCellCount();
  report.waterCells = static_cast<int>(region.cellCount()) - report.landCells;
  report.settlements = static_cast<int>(FindSettlements(region, cfg).size());
  report.elapsedMs =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

  Logf(LogLevel::Debug, "rivers: %d committed (%d segments, %d discarded, %d sources)",
       report.rivers.riversCommitted, report.rivers.segmentsCommitted, report.rivers.tracesDiscarded,
       report.rivers.sourceCandidates);
  Logf(LogLevel::Debug, "roads: %d settlements, %d/%d pairs connected, %d unreachable, %d edges",
       report.roads.settlements, report.roads.pairsConnected, report.roads.candidatePairs,
       report.roads.pairsUnreachable, report.roads.roadEdges);

  op.report("complete", 1.0f);
  if (outReport) *outReport = report;
  return OpResult::Success();
}

OpResult GenerateRegion(const RegionParams& params, const GenerationConfig& cfg, const OperationContext& op,
                        RegionData& outRegion, GenerationReport* outReport)
{
  if (!IsValidRegionSize(params.width, params.height)) {
    return OpResult::Failure(OpStatus::ValidationFailed,
                             "Region size " + std::to_string(params.width) + "x" + std::to_string(params.height) +
                                 " is outside " + std::to_string(kMinRegionSize) + ".." +
                                 std::to_string(kMaxRegionSize));
  }
  if (op.cancelled()) return OpResult::Cancel();

  RegionData region;
  region.reset(params.width, params.height);
  region.name = params.name;
  region.seed = params.seed;
  region.id = params.id.isNil() ? RegionId::Generate(TimeSeed()) : params.id;
  region.generatedAtTicks = NowTicks();

  GenerationContext ctx;
  ctx.region = &region;
  ctx.seed = params.seed;
  ctx.op = op;

  GenerationReport report;
  OpResult res = RunGenerationPasses(ctx, cfg, &report);
  if (!res.ok()) {
    if (res.cancelled()) Logf(LogLevel::Info, "generation of '%s' cancelled", params.name.c_str());
    return res;
  }

  Logf(LogLevel::Info, "generated '%s' %dx%d seed %d: %d land, %d water, %d settlements in %.1f ms",
       region.name.c_str(), region.width(), region.height(), static_cast<int>(region.seed), report.landCells,
       report.waterCells, report.settlements, report.elapsedMs);

  outRegion = std::move(region);
  if (outReport) *outReport = report;
  return OpResult::Success();
}

} // namespace hexregion
