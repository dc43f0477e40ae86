#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace hft {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown by validate() and by the JSON loader. A configuration error is fatal
// at construction: InstrumentEngine never starts a partial pipeline.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class StrategyKind { MarketMaking, Arbitrage };
enum class ClockMode { Live, Simulated };
enum class SourceKind { Synthetic, Zmq };

// How cumulative PnL is measured by the strategies and the Risk Gate.
//   AverageCost — realized PnL against the prior position's average cost.
//   CashFlow    — running cash balance of all fills.
enum class PnlMethod { AverageCost, CashFlow };

const char* toString(StrategyKind kind);
const char* toString(ClockMode mode);
const char* toString(SourceKind kind);
const char* toString(PnlMethod method);

// Seeds of 0 mean "nondeterministic": returns a std::random_device draw for
// 0 and `seed` unchanged otherwise.
std::uint64_t resolveSeed(std::uint64_t seed);

// -----------------------------------------------------------------------------
// MarketMakingParams
// -----------------------------------------------------------------------------
// Zero for base_spread / min_spread means "derive from tick_size"
// (2 ticks and 1 tick respectively).
// -----------------------------------------------------------------------------
struct MarketMakingParams {
  double base_spread{0.0};
  double min_spread{0.0};
  double volatility_sensitivity{1.0};  // k in base_spread * (1 + k * vol)
  std::size_t volatility_window{100};  // quotes in the rolling mid window
  double skew_factor{2.0};             // skew in units of base_spread
  double target_inventory{0.0};
  double inventory_band{0.0};          // |inv - target| inside band: alternate
  double order_size{100.0};
};

struct ArbitrageParams {
  double min_profit_threshold{0.01};  // |mid - fair| must exceed this
  double fair_value_alpha{0.05};      // EMA weight of the newest mid
  double order_size{100.0};
  double max_size_multiplier{5.0};    // cap on |deviation| / threshold
  double reduce_threshold{0.8};       // fraction of max_position
};

// Fill model of the SimulatedVenue.
struct VenueParams {
  std::uint64_t seed{0};                   // 0 = nondeterministic
  double split_probability{0.1};           // chance of two partial fills
  double shock_slippage_probability{0.05};
  double shock_slippage_max{0.01};         // fraction, symmetric around 0
  double impact_per_unit{1e-6};            // fraction of price per unit qty
  std::int64_t fill_latency_ms{0};
};

// Price dynamics of the SyntheticQuoteGenerator.
struct SyntheticSourceParams {
  double initial_mid{100.0};
  double initial_volatility{0.01};
  double volatility_mean{0.01};
  double volatility_reversion{0.01};
  double volatility_noise{0.001};
  double volatility_min{0.001};
  double volatility_max{0.1};
  double trend_noise{0.0001};
  double trend_limit{0.0005};
  double cycle_step{0.001};       // radians per tick
  double cycle_amplitude{0.001};
  double jump_probability{0.001};
  double jump_magnitude{0.05};    // jump is uniform in +/- magnitude / 2
};

// -----------------------------------------------------------------------------
// PipelineConfig — immutable per-instrument configuration
// -----------------------------------------------------------------------------
//
// @brief  Every numeric parameter one pipeline needs, constructed once at
//         startup and shared by const reference among its components.
//
// @details
// The defaults mirror the reference system's defaults (1 ms ticks of 0.01,
// 10k max position, 50k orders/s, $100k max order value, $1000 max drawdown,
// 5% / 60 s circuit breaker).
//
// circuit_breaker_duration_s is in seconds; every other duration is in
// milliseconds.
// -----------------------------------------------------------------------------
struct PipelineConfig {
  std::string symbol{"XYZ"};
  StrategyKind strategy{StrategyKind::MarketMaking};
  ClockMode clock{ClockMode::Live};
  SourceKind source{SourceKind::Synthetic};
  std::string md_endpoint{"tcp://127.0.0.1:5555"};
  std::uint64_t seed{0};       // synthetic source seed, 0 = nondeterministic
  std::uint64_t max_ticks{0};  // synthetic source bound, 0 = infinite

  std::int64_t tick_interval_ms{1};
  double tick_size{0.01};

  double max_position{10'000.0};
  std::uint32_t max_orders_per_second{50'000};
  double max_order_value{100'000.0};
  double max_drawdown{1'000.0};
  double circuit_breaker_pct{5.0};
  double circuit_breaker_duration_s{60.0};

  PnlMethod pnl_method{PnlMethod::AverageCost};

  std::size_t quote_channel_capacity{1024};
  std::size_t fill_channel_capacity{1024};
  std::int64_t drain_timeout_ms{2000};

  MarketMakingParams market_making;
  ArbitrageParams arbitrage;
  VenueParams venue;
  SyntheticSourceParams synthetic;

  std::int64_t circuitBreakerDurationMs() const {
    return static_cast<std::int64_t>(circuit_breaker_duration_s * 1000.0);
  }

  // @throws ConfigError naming the first offending field.
  void validate() const;
};

struct TelemetryConfig {
  std::int64_t interval_ms{1000};
  bool log{true};
  std::string pub_endpoint;  // empty = no ZeroMQ publisher
};

// Process-level configuration: one PipelineConfig per traded instrument.
struct EngineConfig {
  TelemetryConfig telemetry;
  std::vector<PipelineConfig> instruments;

  // Validates the telemetry block and every instrument; also rejects an
  // empty instrument list and duplicate symbols.
  void validate() const;
};

}  // namespace hft
