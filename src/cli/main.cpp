#include "cli/CliParse.hpp"

#include "hexregion/ConfigIO.hpp"
#include "hexregion/Json.hpp"
#include "hexregion/Log.hpp"
#include "hexregion/LogTee.hpp"
#include "hexregion/Pathfinding.hpp"
#include "hexregion/RegionGenerator.hpp"
#include "hexregion/RegionSerializer.hpp"
#include "hexregion/RegionTasks.hpp"
#include "hexregion/RoadGenerator.hpp"
#include "hexregion/Version.hpp"

#include <array>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

using namespace hexregion;

namespace {

// Process exit codes.
constexpr int kExitOk = 0;
constexpr int kExitNoResult = 1;
constexpr int kExitError = 2;
constexpr int kExitCancelled = 3;

void PrintHelp()
{
  std::cout
      << "hexregion_cli (hex terrain region generator)\n\n"
      << "Usage:\n"
      << "  hexregion_cli [--log <file>] [--log-level <level>] <command> [options]\n"
      << "  hexregion_cli --help | --version\n\n"
      << "Commands:\n"
      << "  generate  --out <file.region> [--name <str>] [--size <WxH>] [--seed <i32>]\n"
      << "            [--config <cfg.json>] [--features <0|1>] [--roads <0|1>] [--progress <0|1>]\n"
      << "  info      <file.region> [--metadata-only] [--json]\n"
      << "  path      <file.region> --from <x,z> --to <x,z> [--unit <land|naval|amphibious>]\n"
      << "            [--max-cost <N>] [--block <x,z>]...\n"
      << "  reachable <file.region> --from <x,z> --budget <N> [--unit <type>] [--list]\n"
      << "  config    [--config <cfg.json>] [--out <cfg.json>]\n\n"
      << "Exit codes:\n"
      << "  0 success, 1 no result (e.g. no path), 2 error, 3 cancelled\n\n"
      << "Notes:\n"
      << "  - Region sizes must be within " << kMinRegionSize << ".." << kMaxRegionSize << " per side.\n"
      << "  - Log levels: debug, info, warn, error, off.\n";
}

int ExitCodeFor(const OpResult& r)
{
  if (r.ok()) return kExitOk;
  if (r.cancelled()) return kExitCancelled;
  return kExitError;
}

int ReportFailure(const char* what, const OpResult& r)
{
  std::cerr << what << " failed (" << ToString(r.status) << "): " << r.message << "\n";
  return ExitCodeFor(r);
}

// Shared "value after flag" reader for every subcommand.
class ArgCursor {
public:
  ArgCursor(int argc, char** argv, int first) : m_argc(argc), m_argv(argv), m_i(first) {}

  bool done() const { return m_i >= m_argc; }
  std::string next() { return m_argv[m_i++]; }

  bool requireValue(const std::string& flag, std::string& out)
  {
    if (m_i >= m_argc) {
      std::cerr << flag << " requires a value\n";
      return false;
    }
    out = m_argv[m_i++];
    return true;
  }

private:
  int m_argc = 0;
  char** m_argv = nullptr;
  int m_i = 0;
};

int RunGenerate(ArgCursor& args)
{
  RegionParams params;
  GenerationConfig cfg;
  std::string outPath;
  bool showProgress = false;

  // Flag overrides apply after --config regardless of order.
  int featuresOverride = -1;
  int roadsOverride = -1;

  std::string val;
  while (!args.done()) {
    const std::string arg = args.next();
    if (arg == "--out") {
      if (!args.requireValue(arg, outPath)) return kExitError;
    } else if (arg == "--name") {
      if (!args.requireValue(arg, params.name)) return kExitError;
    } else if (arg == "--size") {
      if (!args.requireValue(arg, val) || !cli::ParseWxH(val, &params.width, &params.height)) {
        std::cerr << "bad --size (expected WxH): " << val << "\n";
        return kExitError;
      }
    } else if (arg == "--seed") {
      int seed = 0;
      if (!args.requireValue(arg, val) || !cli::ParseI32(val, &seed)) {
        std::cerr << "bad --seed: " << val << "\n";
        return kExitError;
      }
      params.seed = seed;
    } else if (arg == "--config") {
      std::string err;
      if (!args.requireValue(arg, val)) return kExitError;
      if (!LoadGenerationConfigJsonFile(val, cfg, err)) {
        std::cerr << "failed to load config: " << err << "\n";
        return kExitError;
      }
    } else if (arg == "--features" || arg == "--roads" || arg == "--progress") {
      bool b = false;
      if (!args.requireValue(arg, val) || !cli::ParseBool01(val, &b)) {
        std::cerr << "bad " << arg << " (expected 0|1): " << val << "\n";
        return kExitError;
      }
      if (arg == "--features") featuresOverride = b ? 1 : 0;
      else if (arg == "--roads") roadsOverride = b ? 1 : 0;
      else showProgress = b;
    } else {
      std::cerr << "unknown generate option: " << arg << "\n";
      return kExitError;
    }
  }

  if (outPath.empty()) {
    std::cerr << "generate requires --out <file.region>\n";
    return kExitError;
  }
  if (featuresOverride >= 0) cfg.featuresEnabled = (featuresOverride == 1);
  if (roadsOverride >= 0) cfg.roadsEnabled = (roadsOverride == 1);

  if (!cli::EnsureParentDir(outPath)) {
    std::cerr << "failed to create output directory for " << outPath << "\n";
    return kExitError;
  }

  OperationContext op;
  if (showProgress) {
    op.progress = [](const OperationProgress& p) {
      std::fprintf(stderr, "  %-14s %5.1f%%\n", p.stage.c_str(), static_cast<double>(p.fraction) * 100.0);
    };
  }

  RegionTaskRunner runner;
  RegionData region;
  GenerationReport report;

  // Generation runs inline to collect the report; the save goes through the worker.
  const OpResult gen = GenerateRegion(params, cfg, op, region, &report);
  if (!gen.ok()) return ReportFailure("generate", gen);

  const OpResult saved = runner.save(region, outPath, op).get();
  if (!saved.ok()) return ReportFailure("save", saved);

  std::cout << "generated '" << region.name << "' " << region.width() << "x" << region.height() << " seed "
            << region.seed << "\n"
            << "  id:          " << region.id.toString() << "\n"
            << "  land/water:  " << report.landCells << "/" << report.waterCells << "\n"
            << "  rivers:      " << report.rivers.riversCommitted << " (" << report.rivers.segmentsCommitted
            << " segments)\n"
            << "  settlements: " << report.settlements << "\n"
            << "  road edges:  " << report.roads.roadEdges << "\n"
            << "  file:        " << outPath << " (" << EstimateRegionFileSize(region) << " bytes)\n";
  return kExitOk;
}

JsonValue MetadataToJson(const RegionMetadata& meta)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("id", JsonValue::MakeString(meta.id.toString()));
  root.set("name", JsonValue::MakeString(meta.name));
  root.set("width", JsonValue::MakeNumber(meta.width));
  root.set("height", JsonValue::MakeNumber(meta.height));
  root.set("seed", JsonValue::MakeNumber(meta.seed));
  root.set("generated_at_ticks", JsonValue::MakeNumber(static_cast<double>(meta.generatedAtTicks)));
  root.set("file_size_bytes", JsonValue::MakeNumber(static_cast<double>(meta.fileSizeBytes)));

  JsonValue conns = JsonValue::MakeArray();
  for (const RegionConnection& c : meta.connections) {
    JsonValue jc = JsonValue::MakeObject();
    jc.set("target_id", JsonValue::MakeString(c.targetId.toString()));
    jc.set("target_name", JsonValue::MakeString(c.targetName));
    jc.set("departure_port", JsonValue::MakeNumber(c.departurePortIndex));
    jc.set("arrival_port", JsonValue::MakeNumber(c.arrivalPortIndex));
    jc.set("travel_time_minutes", JsonValue::MakeNumber(c.travelTimeMinutes));
    jc.set("danger_level", JsonValue::MakeNumber(c.dangerLevel));
    conns.push(std::move(jc));
  }
  root.set("connections", std::move(conns));
  return root;
}

JsonValue CellSummaryJson(const RegionData& region)
{
  std::array<int, kTerrainTypeCount> terrain{};
  std::array<int, 4> bySpecial{};
  int land = 0;
  int riverCells = 0;
  int roadCells = 0;
  int specials = 0;

  for (const CellData& c : region.cells()) {
    ++terrain[static_cast<std::size_t>(c.terrain())];
    if (!c.isUnderwater()) ++land;
    if (c.hasRiver()) ++riverCells;
    if (c.hasRoads()) ++roadCells;
    if (c.special() != SpecialFeature::None) {
      ++specials;
      ++bySpecial[static_cast<std::size_t>(c.special())];
    }
  }

  JsonValue cells = JsonValue::MakeObject();
  cells.set("land", JsonValue::MakeNumber(land));
  cells.set("water", JsonValue::MakeNumber(static_cast<double>(region.cellCount()) - land));
  cells.set("river", JsonValue::MakeNumber(riverCells));
  cells.set("road", JsonValue::MakeNumber(roadCells));
  cells.set("special", JsonValue::MakeNumber(specials));
  cells.set("settlements",
            JsonValue::MakeNumber(static_cast<double>(FindSettlements(region, GenerationConfig{}).size())));

  JsonValue byTerrain = JsonValue::MakeObject();
  for (int t = 0; t < kTerrainTypeCount; ++t) {
    const int n = terrain[static_cast<std::size_t>(t)];
    if (n > 0) byTerrain.set(ToString(static_cast<TerrainType>(t)), JsonValue::MakeNumber(n));
  }
  cells.set("terrain", std::move(byTerrain));

  JsonValue specialKinds = JsonValue::MakeObject();
  for (int s = 1; s < static_cast<int>(bySpecial.size()); ++s) {
    const int n = bySpecial[static_cast<std::size_t>(s)];
    if (n > 0) specialKinds.set(ToString(static_cast<SpecialFeature>(s)), JsonValue::MakeNumber(n));
  }
  cells.set("special_kinds", std::move(specialKinds));
  return cells;
}

void PrintJsonObjectPlain(const JsonValue& obj, int depth)
{
  for (const auto& kv : obj.objectValue) {
    std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ') << kv.first << ":";
    if (kv.second.isObject()) {
      std::cout << "\n";
      PrintJsonObjectPlain(kv.second, depth + 1);
    } else if (kv.second.isArray()) {
      std::cout << " " << kv.second.arrayValue.size() << " entries\n";
    } else if (kv.second.isString()) {
      std::cout << " " << kv.second.stringValue << "\n";
    } else {
      std::cout << " " << JsonStringify(kv.second, -1) << "\n";
    }
  }
}

int RunInfo(ArgCursor& args)
{
  std::string path;
  bool metadataOnly = false;
  bool asJson = false;

  while (!args.done()) {
    const std::string arg = args.next();
    if (arg == "--metadata-only") {
      metadataOnly = true;
    } else if (arg == "--json") {
      asJson = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "unknown info option: " << arg << "\n";
      return kExitError;
    } else if (path.empty()) {
      path = arg;
    } else {
      std::cerr << "info takes a single region file\n";
      return kExitError;
    }
  }
  if (path.empty()) {
    std::cerr << "info requires a region file\n";
    return kExitError;
  }

  RegionMetadata meta;
  const OpResult mr = ReadRegionMetadata(path, meta);
  if (!mr.ok()) return ReportFailure("read metadata", mr);

  JsonValue root = MetadataToJson(meta);
  if (!metadataOnly) {
    RegionData region;
    const OpResult lr = LoadRegion(path, region);
    if (!lr.ok()) return ReportFailure("load", lr);
    root.set("cells", CellSummaryJson(region));
  }

  if (asJson) {
    std::cout << JsonStringify(root, 2) << "\n";
  } else {
    PrintJsonObjectPlain(root, 0);
  }
  return kExitOk;
}

bool LoadRegionForQuery(const std::string& path, RegionData& region, int& exitCode)
{
  if (path.empty()) {
    std::cerr << "a region file is required\n";
    exitCode = kExitError;
    return false;
  }
  const OpResult r = LoadRegion(path, region);
  if (!r.ok()) {
    exitCode = ReportFailure("load", r);
    return false;
  }
  return true;
}

bool ParseCoordFlag(ArgCursor& args, const std::string& flag, OffsetCoord& out)
{
  std::string val;
  if (!args.requireValue(flag, val)) return false;
  if (!cli::ParseCellCoord(val, &out)) {
    std::cerr << "bad " << flag << " (expected x,z): " << val << "\n";
    return false;
  }
  return true;
}

bool ParseUnitFlag(ArgCursor& args, UnitType& out)
{
  std::string val;
  if (!args.requireValue("--unit", val)) return false;
  if (!ParseUnitType(val, out)) {
    std::cerr << "unknown unit type: " << val << "\n";
    return false;
  }
  return true;
}

int RunPath(ArgCursor& args)
{
  std::string path;
  OffsetCoord from;
  OffsetCoord to;
  bool haveFrom = false;
  bool haveTo = false;
  PathOptions opt;
  std::vector<OffsetCoord> blocked;

  std::string val;
  while (!args.done()) {
    const std::string arg = args.next();
    if (arg == "--from") {
      if (!ParseCoordFlag(args, arg, from)) return kExitError;
      haveFrom = true;
    } else if (arg == "--to") {
      if (!ParseCoordFlag(args, arg, to)) return kExitError;
      haveTo = true;
    } else if (arg == "--unit") {
      if (!ParseUnitFlag(args, opt.unitType)) return kExitError;
    } else if (arg == "--max-cost") {
      if (!args.requireValue(arg, val) || !cli::ParseF32(val, &opt.maxCost) || opt.maxCost < 0.0f) {
        std::cerr << "bad --max-cost: " << val << "\n";
        return kExitError;
      }
    } else if (arg == "--block") {
      OffsetCoord c;
      if (!ParseCoordFlag(args, arg, c)) return kExitError;
      blocked.push_back(c);
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "unknown path option: " << arg << "\n";
      return kExitError;
    } else {
      path = arg;
    }
  }
  if (!haveFrom || !haveTo) {
    std::cerr << "path requires --from and --to\n";
    return kExitError;
  }

  RegionData region;
  int code = kExitOk;
  if (!LoadRegionForQuery(path, region, code)) return code;

  if (!blocked.empty()) {
    opt.isOccupied = [&blocked](OffsetCoord c) {
      for (const OffsetCoord& b : blocked) {
        if (b == c) return true;
      }
      return false;
    };
  }

  const PathResult result = FindPath(region, from, to, opt);
  if (result.cancelled) return kExitCancelled;
  if (!result.reachable) {
    std::cout << "no path for " << ToString(opt.unitType) << " unit\n";
    return kExitNoResult;
  }

  std::cout << "cost " << result.totalCost << " over " << (result.path.size() - 1) << " steps\n";
  for (const OffsetCoord& c : result.path) std::cout << "  " << c.x << "," << c.z << "\n";
  return kExitOk;
}

int RunReachable(ArgCursor& args)
{
  std::string path;
  OffsetCoord from;
  bool haveFrom = false;
  float budget = -1.0f;
  bool list = false;
  PathOptions opt;

  std::string val;
  while (!args.done()) {
    const std::string arg = args.next();
    if (arg == "--from") {
      if (!ParseCoordFlag(args, arg, from)) return kExitError;
      haveFrom = true;
    } else if (arg == "--budget") {
      if (!args.requireValue(arg, val) || !cli::ParseF32(val, &budget) || budget < 0.0f) {
        std::cerr << "bad --budget: " << val << "\n";
        return kExitError;
      }
    } else if (arg == "--unit") {
      if (!ParseUnitFlag(args, opt.unitType)) return kExitError;
    } else if (arg == "--list") {
      list = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "unknown reachable option: " << arg << "\n";
      return kExitError;
    } else {
      path = arg;
    }
  }
  if (!haveFrom || budget < 0.0f) {
    std::cerr << "reachable requires --from and --budget\n";
    return kExitError;
  }

  RegionData region;
  int code = kExitOk;
  if (!LoadRegionForQuery(path, region, code)) return code;

  const std::vector<ReachableCell> cells = GetReachableCells(region, from, budget, opt);
  if (cells.empty()) {
    std::cout << "start cell out of bounds\n";
    return kExitNoResult;
  }

  std::cout << cells.size() << " cells reachable within " << budget << "\n";
  if (list) {
    for (const ReachableCell& c : cells) std::cout << "  " << c.cell.x << "," << c.cell.z << " " << c.cost << "\n";
  }
  return kExitOk;
}

int RunConfig(ArgCursor& args)
{
  GenerationConfig cfg;
  std::string outPath;
  std::string val;
  std::string err;

  while (!args.done()) {
    const std::string arg = args.next();
    if (arg == "--config") {
      if (!args.requireValue(arg, val)) return kExitError;
      if (!LoadGenerationConfigJsonFile(val, cfg, err)) {
        std::cerr << "failed to load config: " << err << "\n";
        return kExitError;
      }
    } else if (arg == "--out") {
      if (!args.requireValue(arg, outPath)) return kExitError;
    } else {
      std::cerr << "unknown config option: " << arg << "\n";
      return kExitError;
    }
  }

  if (outPath.empty()) {
    std::cout << GenerationConfigToJson(cfg);
    return kExitOk;
  }
  if (!cli::EnsureParentDir(outPath) || !WriteGenerationConfigJsonFile(outPath, cfg, err)) {
    std::cerr << "failed to write config: " << (err.empty() ? outPath : err) << "\n";
    return kExitError;
  }
  std::cout << "wrote " << outPath << "\n";
  return kExitOk;
}

} // namespace

int main(int argc, char** argv)
{
  LogTee tee;
  std::string val;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return kExitOk;
    }
    if (arg == "--version") {
      std::cout << "hexregion_cli " << HexRegionFullVersionString() << "\n";
      return kExitOk;
    }
    if (arg == "--log" || arg == "--log-level") {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires a value\n";
        return kExitError;
      }
      val = argv[++i];
      if (arg == "--log-level") {
        LogLevel level = LogLevel::Info;
        if (!ParseLogLevel(val, level)) {
          std::cerr << "unknown log level: " << val << "\n";
          return kExitError;
        }
        SetLogLevel(level);
      } else {
        LogTeeOptions opt;
        opt.path = val;
        std::string err;
        if (!tee.start(opt, err)) {
          std::cerr << "failed to start log: " << err << "\n";
          return kExitError;
        }
      }
      continue;
    }
    break;
  }

  if (i >= argc) {
    PrintHelp();
    return kExitError;
  }

  const std::string cmd = argv[i];
  ArgCursor args(argc, argv, i + 1);

  if (cmd == "generate") return RunGenerate(args);
  if (cmd == "info") return RunInfo(args);
  if (cmd == "path") return RunPath(args);
  if (cmd == "reachable") return RunReachable(args);
  if (cmd == "config") return RunConfig(args);

  std::cerr << "unknown command: " << cmd << "\n\n";
  PrintHelp();
  return kExitError;
}
