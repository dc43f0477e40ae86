#include "hft/config/pipeline_config.hpp"

#include <cmath>
#include <random>
#include <set>

namespace hft {

namespace {

void require(bool condition, const std::string& symbol,
             const std::string& message) {
  if (!condition) {
    throw ConfigError("[" + symbol + "] " + message);
  }
}

bool isFinitePositive(double value) {
  return std::isfinite(value) && value > 0.0;
}

}  // namespace

// -----------------------------------------------------------------------------
// Enum names (also the JSON tags accepted by the loader)
// -----------------------------------------------------------------------------
const char* toString(StrategyKind kind) {
  switch (kind) {
    case StrategyKind::MarketMaking: return "market_making";
    case StrategyKind::Arbitrage:    return "arbitrage";
  }
  return "unknown";
}

const char* toString(ClockMode mode) {
  switch (mode) {
    case ClockMode::Live:      return "live";
    case ClockMode::Simulated: return "simulated";
  }
  return "unknown";
}

const char* toString(SourceKind kind) {
  switch (kind) {
    case SourceKind::Synthetic: return "synthetic";
    case SourceKind::Zmq:       return "zmq";
  }
  return "unknown";
}

const char* toString(PnlMethod method) {
  switch (method) {
    case PnlMethod::AverageCost: return "average_cost";
    case PnlMethod::CashFlow:    return "cash_flow";
  }
  return "unknown";
}

std::uint64_t resolveSeed(std::uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32) | device();
}

// -----------------------------------------------------------------------------
// PipelineConfig::validate
// -----------------------------------------------------------------------------
void PipelineConfig::validate() const {
  require(!symbol.empty(), "<unnamed>", "symbol must not be empty");

  // --- Risk limits ----------------------------------------------------------
  require(isFinitePositive(max_position), symbol, "max_position must be > 0");
  require(max_orders_per_second > 0, symbol,
          "max_orders_per_second must be > 0");
  require(isFinitePositive(max_order_value), symbol,
          "max_order_value must be > 0");
  require(std::isfinite(max_drawdown) && max_drawdown >= 0.0, symbol,
          "max_drawdown must be >= 0");
  require(isFinitePositive(circuit_breaker_pct), symbol,
          "circuit_breaker_pct must be > 0");
  require(std::isfinite(circuit_breaker_duration_s) &&
              circuit_breaker_duration_s >= 0.0,
          symbol, "circuit_breaker_duration must not be negative");

  // --- Market event pacing --------------------------------------------------
  require(tick_interval_ms > 0, symbol, "tick_interval_ms must be > 0");
  require(isFinitePositive(tick_size), symbol, "tick_size must be > 0");

  // --- Channels ---------------------------------------------------------------
  require(quote_channel_capacity > 0, symbol,
          "quote_channel_capacity must be > 0");
  require(fill_channel_capacity > 0, symbol,
          "fill_channel_capacity must be > 0");
  require(drain_timeout_ms >= 0, symbol, "drain_timeout_ms must be >= 0");

  if (source == SourceKind::Zmq) {
    require(!md_endpoint.empty(), symbol,
            "md_endpoint is required for the zmq source");
  }

  // --- Strategy parameters ----------------------------------------------------
  const MarketMakingParams& mm = market_making;
  require(std::isfinite(mm.base_spread) && mm.base_spread >= 0.0, symbol,
          "market_making.base_spread must be >= 0");
  require(std::isfinite(mm.min_spread) && mm.min_spread >= 0.0, symbol,
          "market_making.min_spread must be >= 0");
  require(std::isfinite(mm.volatility_sensitivity) &&
              mm.volatility_sensitivity >= 0.0,
          symbol, "market_making.volatility_sensitivity must be >= 0");
  require(mm.volatility_window >= 2, symbol,
          "market_making.volatility_window must be >= 2");
  require(std::isfinite(mm.skew_factor) && mm.skew_factor >= 0.0, symbol,
          "market_making.skew_factor must be >= 0");
  require(std::abs(mm.target_inventory) < max_position, symbol,
          "market_making.target_inventory must lie inside max_position");
  require(std::isfinite(mm.inventory_band) && mm.inventory_band >= 0.0,
          symbol, "market_making.inventory_band must be >= 0");
  require(isFinitePositive(mm.order_size), symbol,
          "market_making.order_size must be > 0");

  const ArbitrageParams& arb = arbitrage;
  require(isFinitePositive(arb.min_profit_threshold), symbol,
          "arbitrage.min_profit_threshold must be > 0");
  require(arb.fair_value_alpha > 0.0 && arb.fair_value_alpha <= 1.0, symbol,
          "arbitrage.fair_value_alpha must be in (0, 1]");
  require(isFinitePositive(arb.order_size), symbol,
          "arbitrage.order_size must be > 0");
  require(arb.max_size_multiplier >= 1.0, symbol,
          "arbitrage.max_size_multiplier must be >= 1");
  require(arb.reduce_threshold > 0.0 && arb.reduce_threshold <= 1.0, symbol,
          "arbitrage.reduce_threshold must be in (0, 1]");

  // --- Simulated venue --------------------------------------------------------
  require(venue.split_probability >= 0.0 && venue.split_probability <= 1.0,
          symbol, "venue.split_probability must be in [0, 1]");
  require(venue.shock_slippage_probability >= 0.0 &&
              venue.shock_slippage_probability <= 1.0,
          symbol, "venue.shock_slippage_probability must be in [0, 1]");
  require(venue.shock_slippage_max >= 0.0 && venue.shock_slippage_max < 1.0,
          symbol, "venue.shock_slippage_max must be in [0, 1)");
  require(venue.impact_per_unit >= 0.0, symbol,
          "venue.impact_per_unit must be >= 0");
  require(venue.fill_latency_ms >= 0, symbol,
          "venue.fill_latency_ms must be >= 0");

  // --- Synthetic source -------------------------------------------------------
  const SyntheticSourceParams& syn = synthetic;
  require(isFinitePositive(syn.initial_mid), symbol,
          "synthetic.initial_mid must be > 0");
  require(syn.volatility_min > 0.0 && syn.volatility_min <= syn.volatility_max,
          symbol, "synthetic.volatility_min must be in (0, volatility_max]");
  require(syn.volatility_reversion >= 0.0 && syn.volatility_reversion <= 1.0,
          symbol, "synthetic.volatility_reversion must be in [0, 1]");
  require(syn.trend_limit >= 0.0, symbol, "synthetic.trend_limit must be >= 0");
  require(syn.jump_probability >= 0.0 && syn.jump_probability <= 1.0, symbol,
          "synthetic.jump_probability must be in [0, 1]");
  require(syn.jump_magnitude >= 0.0 && syn.jump_magnitude < 2.0, symbol,
          "synthetic.jump_magnitude must be in [0, 2)");
}

// -----------------------------------------------------------------------------
// EngineConfig::validate
// -----------------------------------------------------------------------------
void EngineConfig::validate() const {
  if (telemetry.interval_ms <= 0) {
    throw ConfigError("telemetry.interval_ms must be > 0");
  }
  if (instruments.empty()) {
    throw ConfigError("at least one instrument must be configured");
  }

  std::set<std::string> seen;
  for (const auto& instrument : instruments) {
    instrument.validate();
    if (!seen.insert(instrument.symbol).second) {
      throw ConfigError("duplicate instrument symbol: " + instrument.symbol);
    }
  }
}

}  // namespace hft
