#pragma once

#include "hexregion/GenerationConfig.hpp"
#include "hexregion/Json.hpp"

#include <string>

namespace hexregion {

// JSON IO for GenerationConfig.
//
// The document is a single flat object whose keys are the snake_case field
// names ("land_fraction", "max_river_length", ...). Applying JSON merges into an
// existing config: missing keys keep their current value, present keys must have
// the right JSON type.

std::string GenerationConfigToJson(const GenerationConfig& cfg, int indentSpaces = 2);

bool ApplyGenerationConfigJson(const JsonValue& root, GenerationConfig& ioCfg, std::string& outError);

bool WriteGenerationConfigJsonFile(const std::string& path, const GenerationConfig& cfg, std::string& outError,
                                   int indentSpaces = 2);

// Loads and merges into ioCfg. On failure ioCfg is left unchanged.
bool LoadGenerationConfigJsonFile(const std::string& path, GenerationConfig& ioCfg, std::string& outError);

} // namespace hexregion
