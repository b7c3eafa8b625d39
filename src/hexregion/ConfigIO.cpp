#include "hexregion/ConfigIO.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace hexregion {

namespace {

static bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

static bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  const double dv = v->numberValue;
  if (!std::isfinite(dv) || dv < static_cast<double>(std::numeric_limits<int>::min()) ||
      dv > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(dv));
  return true;
}

static bool ApplyF32(const JsonValue& root, const char* key, float& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  const double dv = v->numberValue;
  if (!std::isfinite(dv) || std::fabs(dv) > static_cast<double>(std::numeric_limits<float>::max())) {
    err = std::string("out-of-range float for key '") + key + "'";
    return false;
  }
  io = static_cast<float>(dv);
  return true;
}

static std::string FloatToJson(float v)
{
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(6);
  oss << static_cast<double>(v);
  std::string s = oss.str();
  while (s.size() > 1 && s.find('.') != std::string::npos && s.back() == '0') s.pop_back();
  if (!s.empty() && s.back() == '.') s.pop_back();
  if (s.empty() || s == "-0") s = "0";
  return s;
}

// Writes "key": value lines with a trailing comma on all but the last one.
class FlatObjectWriter {
public:
  FlatObjectWriter(std::ostringstream& oss, int indent) : m_oss(oss), m_indent(indent) { m_oss << "{"; }

  void field(const char* key, const std::string& rawValue)
  {
    if (!m_first) m_oss << ",";
    m_first = false;
    m_oss << "\n";
    for (int i = 0; i < m_indent; ++i) m_oss << ' ';
    m_oss << '"' << key << "\": " << rawValue;
  }

  void f32(const char* key, float v) { field(key, FloatToJson(v)); }
  void i32(const char* key, int v) { field(key, std::to_string(v)); }
  void boolean(const char* key, bool v) { field(key, v ? "true" : "false"); }

  void finish() { m_oss << "\n}\n"; }

private:
  std::ostringstream& m_oss;
  int m_indent = 2;
  bool m_first = true;
};

static bool ReadFileText(const std::string& path, std::string& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream oss;
  oss << f.rdbuf();
  if (f.bad()) return false;
  out = oss.str();
  return true;
}

static bool WriteFileText(const std::string& path, const std::string& text)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  f << text;
  f.flush();
  return static_cast<bool>(f);
}

} // namespace

std::string GenerationConfigToJson(const GenerationConfig& cfg, int indentSpaces)
{
  std::ostringstream oss;
  FlatObjectWriter w(oss, indentSpaces < 0 ? 0 : indentSpaces);

  w.f32("land_fraction", cfg.landFraction);
  w.f32("terrain_scale", cfg.terrainScale);
  w.i32("terrain_octaves", cfg.terrainOctaves);

  w.f32("moisture_scale", cfg.moistureScale);
  w.i32("moisture_octaves", cfg.moistureOctaves);
  w.f32("coastal_moisture_boost", cfg.coastalMoistureBoost);
  w.f32("temperature_lapse_rate", cfg.temperatureLapseRate);
  w.f32("desert_moisture", cfg.desertMoisture);
  w.f32("grassland_moisture", cfg.grasslandMoisture);
  w.f32("forest_moisture", cfg.forestMoisture);
  w.f32("jungle_moisture", cfg.jungleMoisture);
  w.f32("cold_temperature", cfg.coldTemperature);
  w.i32("hill_height", cfg.hillHeight);
  w.i32("mountain_height", cfg.mountainHeight);
  w.i32("snow_height", cfg.snowHeight);

  w.f32("river_fraction", cfg.riverFraction);
  w.i32("min_river_length", cfg.minRiverLength);
  w.i32("max_river_length", cfg.maxRiverLength);
  w.f32("river_source_min_fitness", cfg.riverSourceMinFitness);
  w.f32("river_steepness_weight", cfg.riverSteepnessWeight);
  w.f32("weighted_high_threshold", cfg.weightedHighThreshold);
  w.f32("weighted_medium_threshold", cfg.weightedMediumThreshold);
  w.f32("weight_high", cfg.weightHigh);
  w.f32("weight_medium", cfg.weightMedium);
  w.f32("weight_low", cfg.weightLow);

  w.boolean("features_enabled", cfg.featuresEnabled);
  w.f32("feature_chance", cfg.featureChance);
  w.f32("special_feature_chance", cfg.specialFeatureChance);
  w.i32("castle_min_elevation", cfg.castleMinElevation);
  w.f32("megaflora_moisture", cfg.megafloraMoisture);

  w.boolean("roads_enabled", cfg.roadsEnabled);
  w.i32("settlement_urban_threshold", cfg.settlementUrbanThreshold);
  w.i32("max_settlement_distance", cfg.maxSettlementDistance);
  w.i32("max_road_path_length", cfg.maxRoadPathLength);
  w.i32("max_partners_per_settlement", cfg.maxPartnersPerSettlement);

  w.finish();
  return oss.str();
}

bool ApplyGenerationConfigJson(const JsonValue& root, GenerationConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "generation config JSON must be an object";
    return false;
  }

  // Work on a copy so a failure midway leaves ioCfg untouched.
  GenerationConfig c = ioCfg;
  std::string err;

  const bool ok =
      ApplyF32(root, "land_fraction", c.landFraction, err) && ApplyF32(root, "terrain_scale", c.terrainScale, err) &&
      ApplyI32(root, "terrain_octaves", c.terrainOctaves, err) &&
      ApplyF32(root, "moisture_scale", c.moistureScale, err) &&
      ApplyI32(root, "moisture_octaves", c.moistureOctaves, err) &&
      ApplyF32(root, "coastal_moisture_boost", c.coastalMoistureBoost, err) &&
      ApplyF32(root, "temperature_lapse_rate", c.temperatureLapseRate, err) &&
      ApplyF32(root, "desert_moisture", c.desertMoisture, err) &&
      ApplyF32(root, "grassland_moisture", c.grasslandMoisture, err) &&
      ApplyF32(root, "forest_moisture", c.forestMoisture, err) &&
      ApplyF32(root, "jungle_moisture", c.jungleMoisture, err) &&
      ApplyF32(root, "cold_temperature", c.coldTemperature, err) &&
      ApplyI32(root, "hill_height", c.hillHeight, err) && ApplyI32(root, "mountain_height", c.mountainHeight, err) &&
      ApplyI32(root, "snow_height", c.snowHeight, err) && ApplyF32(root, "river_fraction", c.riverFraction, err) &&
      ApplyI32(root, "min_river_length", c.minRiverLength, err) &&
      ApplyI32(root, "max_river_length", c.maxRiverLength, err) &&
      ApplyF32(root, "river_source_min_fitness", c.riverSourceMinFitness, err) &&
      ApplyF32(root, "river_steepness_weight", c.riverSteepnessWeight, err) &&
      ApplyF32(root, "weighted_high_threshold", c.weightedHighThreshold, err) &&
      ApplyF32(root, "weighted_medium_threshold", c.weightedMediumThreshold, err) &&
      ApplyF32(root, "weight_high", c.weightHigh, err) && ApplyF32(root, "weight_medium", c.weightMedium, err) &&
      ApplyF32(root, "weight_low", c.weightLow, err) &&
      ApplyBool(root, "features_enabled", c.featuresEnabled, err) &&
      ApplyF32(root, "feature_chance", c.featureChance, err) &&
      ApplyF32(root, "special_feature_chance", c.specialFeatureChance, err) &&
      ApplyI32(root, "castle_min_elevation", c.castleMinElevation, err) &&
      ApplyF32(root, "megaflora_moisture", c.megafloraMoisture, err) &&
      ApplyBool(root, "roads_enabled", c.roadsEnabled, err) &&
      ApplyI32(root, "settlement_urban_threshold", c.settlementUrbanThreshold, err) &&
      ApplyI32(root, "max_settlement_distance", c.maxSettlementDistance, err) &&
      ApplyI32(root, "max_road_path_length", c.maxRoadPathLength, err) &&
      ApplyI32(root, "max_partners_per_settlement", c.maxPartnersPerSettlement, err);

  if (!ok) {
    outError = err;
    return false;
  }

  if (c.landFraction < 0.0f || c.landFraction > 1.0f) {
    outError = "land_fraction must be in [0,1]";
    return false;
  }
  if (c.minRiverLength < 1 || c.maxRiverLength < c.minRiverLength) {
    outError = "river lengths must satisfy 1 <= min_river_length <= max_river_length";
    return false;
  }
  if (c.maxPartnersPerSettlement < 1) {
    outError = "max_partners_per_settlement must be >= 1";
    return false;
  }

  ioCfg = c;
  outError.clear();
  return true;
}

bool WriteGenerationConfigJsonFile(const std::string& path, const GenerationConfig& cfg, std::string& outError,
                                   int indentSpaces)
{
  if (!WriteFileText(path, GenerationConfigToJson(cfg, indentSpaces))) {
    outError = "failed to write file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

bool LoadGenerationConfigJsonFile(const std::string& path, GenerationConfig& ioCfg, std::string& outError)
{
  std::string text;
  if (!ReadFileText(path, text)) {
    outError = "failed to read file: " + path;
    return false;
  }

  JsonValue root;
  std::string err;
  if (!ParseJson(text, root, err)) {
    outError = path + ": " + err;
    return false;
  }
  return ApplyGenerationConfigJson(root, ioCfg, outError);
}

} // namespace hexregion
