#pragma once

#include "hft/config/pipeline_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace hft {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @brief  Builds EngineConfig / PipelineConfig from JSON.
//
// @details
// Every key is optional; a missing key keeps the struct default. Known keys
// with the wrong JSON type, unknown enum tags, and values that fail
// validate() all surface as ConfigError, so callers only catch one type.
//
// Layout:
//   {
//     "telemetry":   { "interval_ms": 1000, "log": true,
//                      "pub_endpoint": "tcp://127.0.0.1:5557" },
//     "instruments": [ { "symbol": "XYZ", "strategy": "market_making", ... } ]
//   }
//
// The returned configs are already validated.
// -----------------------------------------------------------------------------

// @throws ConfigError if the file cannot be opened, is not valid JSON, or
//         fails validation.
EngineConfig loadEngineConfig(const std::string& path);

// @throws ConfigError on any type or validation failure.
EngineConfig parseEngineConfig(const nlohmann::json& json);

// Parses a single instrument block. Does not validate.
PipelineConfig parsePipelineConfig(const nlohmann::json& json);

// Configuration used when the binary starts without a file: one synthetic
// market-making instrument on a live clock.
EngineConfig defaultEngineConfig();

}  // namespace hft
