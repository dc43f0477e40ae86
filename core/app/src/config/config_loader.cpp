#include "hft/config/config_loader.hpp"

#include <fstream>
#include <initializer_list>

namespace hft {

namespace {

// Copies json[key] into `out` when present; keeps the default otherwise.
// A present key of the wrong type throws nlohmann::json::type_error, which
// parseEngineConfig() turns into ConfigError.
template <typename T>
void read(const nlohmann::json& json, const char* key, T& out) {
  auto it = json.find(key);
  if (it != json.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

template <typename Enum>
Enum parseTag(const std::string& tag, const char* field,
              std::initializer_list<Enum> candidates) {
  for (Enum candidate : candidates) {
    if (tag == toString(candidate)) {
      return candidate;
    }
  }
  throw ConfigError(std::string("unknown ") + field + ": \"" + tag + "\"");
}

template <typename Enum>
void readTag(const nlohmann::json& json, const char* key, Enum& out,
             std::initializer_list<Enum> candidates) {
  auto it = json.find(key);
  if (it != json.end() && !it->is_null()) {
    out = parseTag(it->get<std::string>(), key, candidates);
  }
}

MarketMakingParams parseMarketMaking(const nlohmann::json& json) {
  MarketMakingParams p;
  read(json, "base_spread", p.base_spread);
  read(json, "min_spread", p.min_spread);
  read(json, "volatility_sensitivity", p.volatility_sensitivity);
  read(json, "volatility_window", p.volatility_window);
  read(json, "skew_factor", p.skew_factor);
  read(json, "target_inventory", p.target_inventory);
  read(json, "inventory_band", p.inventory_band);
  read(json, "order_size", p.order_size);
  return p;
}

ArbitrageParams parseArbitrage(const nlohmann::json& json) {
  ArbitrageParams p;
  read(json, "min_profit_threshold", p.min_profit_threshold);
  read(json, "fair_value_alpha", p.fair_value_alpha);
  read(json, "order_size", p.order_size);
  read(json, "max_size_multiplier", p.max_size_multiplier);
  read(json, "reduce_threshold", p.reduce_threshold);
  return p;
}

VenueParams parseVenue(const nlohmann::json& json) {
  VenueParams p;
  read(json, "seed", p.seed);
  read(json, "split_probability", p.split_probability);
  read(json, "shock_slippage_probability", p.shock_slippage_probability);
  read(json, "shock_slippage_max", p.shock_slippage_max);
  read(json, "impact_per_unit", p.impact_per_unit);
  read(json, "fill_latency_ms", p.fill_latency_ms);
  return p;
}

SyntheticSourceParams parseSynthetic(const nlohmann::json& json) {
  SyntheticSourceParams p;
  read(json, "initial_mid", p.initial_mid);
  read(json, "initial_volatility", p.initial_volatility);
  read(json, "volatility_mean", p.volatility_mean);
  read(json, "volatility_reversion", p.volatility_reversion);
  read(json, "volatility_noise", p.volatility_noise);
  read(json, "volatility_min", p.volatility_min);
  read(json, "volatility_max", p.volatility_max);
  read(json, "trend_noise", p.trend_noise);
  read(json, "trend_limit", p.trend_limit);
  read(json, "cycle_step", p.cycle_step);
  read(json, "cycle_amplitude", p.cycle_amplitude);
  read(json, "jump_probability", p.jump_probability);
  read(json, "jump_magnitude", p.jump_magnitude);
  return p;
}

}  // namespace

// -----------------------------------------------------------------------------
// parsePipelineConfig
// -----------------------------------------------------------------------------
PipelineConfig parsePipelineConfig(const nlohmann::json& json) {
  PipelineConfig cfg;

  read(json, "symbol", cfg.symbol);
  readTag(json, "strategy", cfg.strategy,
          {StrategyKind::MarketMaking, StrategyKind::Arbitrage});
  readTag(json, "clock", cfg.clock, {ClockMode::Live, ClockMode::Simulated});
  readTag(json, "source", cfg.source,
          {SourceKind::Synthetic, SourceKind::Zmq});
  readTag(json, "pnl_method", cfg.pnl_method,
          {PnlMethod::AverageCost, PnlMethod::CashFlow});
  read(json, "md_endpoint", cfg.md_endpoint);
  read(json, "seed", cfg.seed);
  read(json, "max_ticks", cfg.max_ticks);

  read(json, "tick_interval_ms", cfg.tick_interval_ms);
  read(json, "tick_size", cfg.tick_size);

  read(json, "max_position", cfg.max_position);
  read(json, "max_orders_per_second", cfg.max_orders_per_second);
  read(json, "max_order_value", cfg.max_order_value);
  read(json, "max_drawdown", cfg.max_drawdown);
  read(json, "circuit_breaker_pct", cfg.circuit_breaker_pct);
  read(json, "circuit_breaker_duration", cfg.circuit_breaker_duration_s);

  read(json, "quote_channel_capacity", cfg.quote_channel_capacity);
  read(json, "fill_channel_capacity", cfg.fill_channel_capacity);
  read(json, "drain_timeout_ms", cfg.drain_timeout_ms);

  if (auto it = json.find("market_making"); it != json.end()) {
    cfg.market_making = parseMarketMaking(*it);
  }
  if (auto it = json.find("arbitrage"); it != json.end()) {
    cfg.arbitrage = parseArbitrage(*it);
  }
  if (auto it = json.find("venue"); it != json.end()) {
    cfg.venue = parseVenue(*it);
  }
  if (auto it = json.find("synthetic"); it != json.end()) {
    cfg.synthetic = parseSynthetic(*it);
  }

  return cfg;
}

// -----------------------------------------------------------------------------
// parseEngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& json) {
  EngineConfig cfg;

  try {
    if (!json.is_object()) {
      throw ConfigError("configuration root must be a JSON object");
    }

    if (auto it = json.find("telemetry"); it != json.end()) {
      read(*it, "interval_ms", cfg.telemetry.interval_ms);
      read(*it, "log", cfg.telemetry.log);
      read(*it, "pub_endpoint", cfg.telemetry.pub_endpoint);
    }

    if (auto it = json.find("instruments"); it != json.end()) {
      if (!it->is_array()) {
        throw ConfigError("\"instruments\" must be an array");
      }
      for (const auto& entry : *it) {
        cfg.instruments.push_back(parsePipelineConfig(entry));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("malformed configuration: ") + e.what());
  }

  cfg.validate();
  return cfg;
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file: " + path);
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("invalid JSON in " + path + ": " + e.what());
  }

  return parseEngineConfig(json);
}

// -----------------------------------------------------------------------------
// defaultEngineConfig
// -----------------------------------------------------------------------------
EngineConfig defaultEngineConfig() {
  EngineConfig cfg;
  cfg.instruments.emplace_back();
  cfg.validate();
  return cfg;
}

}  // namespace hft
