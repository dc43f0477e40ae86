#include "hft/market/synthetic_quote_generator.hpp"

#include <algorithm>
#include <cmath>

namespace hft {

SyntheticQuoteGenerator::SyntheticQuoteGenerator(
    const SyntheticSourceParams& params, double tick_size, std::uint64_t seed)
    : params_(params),
      tick_size_(tick_size),
      rng_(resolveSeed(seed)),
      mid_(std::max(params.initial_mid, tick_size)),
      volatility_(std::clamp(params.initial_volatility, params.volatility_min,
                             params.volatility_max)) {}

double SyntheticQuoteGenerator::uniformCentered() { return unit_(rng_) - 0.5; }

// -----------------------------------------------------------------------------
// next(): advance the model by one tick
// -----------------------------------------------------------------------------
domain::Quote SyntheticQuoteGenerator::next(std::int64_t timestamp_ms) {
  ++ticks_;

  // --- Volatility: mean-reverting random walk ------------------------------
  volatility_ += params_.volatility_reversion *
                     (params_.volatility_mean - volatility_) +
                 uniformCentered() * params_.volatility_noise;
  volatility_ =
      std::clamp(volatility_, params_.volatility_min, params_.volatility_max);

  // --- Trend: bounded drift -------------------------------------------------
  trend_ += uniformCentered() * params_.trend_noise;
  trend_ = std::clamp(trend_, -params_.trend_limit, params_.trend_limit);

  // --- Cycle -----------------------------------------------------------------
  phase_ += params_.cycle_step;
  const double cycle = std::sin(phase_) * params_.cycle_amplitude;

  mid_ += mid_ * (uniformCentered() * volatility_ + trend_ + cycle);

  // --- Rare jump; the new level persists -------------------------------------
  if (unit_(rng_) < params_.jump_probability) {
    mid_ *= 1.0 + uniformCentered() * params_.jump_magnitude;
  }

  // Floor one tick above the half spread so the bid stays positive.
  const double half_spread = tick_size_ * (1.0 + volatility_ * 100.0) / 2.0;
  mid_ = std::max(mid_, half_spread + tick_size_);

  domain::Quote quote;
  quote.bid = mid_ - half_spread;
  quote.ask = mid_ + half_spread;
  quote.timestamp_ms = timestamp_ms;
  return quote;
}

}  // namespace hft
