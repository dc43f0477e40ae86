#pragma once

#include "hft/config/pipeline_config.hpp"
#include "hft/domain/quote.hpp"

#include <cstdint>
#include <random>

namespace hft {

// -----------------------------------------------------------------------------
// SyntheticQuoteGenerator — stochastic mid-price model
// -----------------------------------------------------------------------------
//
// @brief  Produces one Quote per call to next(), evolving an internal mid and
//         volatility. Pure apart from its own RNG: no clock, no I/O.
//
// @details
// Per tick:
//   vol   += reversion * (vol_mean - vol) + U(-0.5, 0.5) * vol_noise,
//            clamped to [vol_min, vol_max]          (volatility clustering)
//   trend += U(-0.5, 0.5) * trend_noise, clamped to +/- trend_limit
//   phase += cycle_step; cycle = sin(phase) * cycle_amplitude
//   mid   += mid * (U(-0.5, 0.5) * vol + trend + cycle)
//   with probability jump_probability:
//   mid   *= 1 + U(-0.5, 0.5) * jump_magnitude     (jump persists)
//   spread = tick_size * (1 + vol * 100)
//   mid    = max(mid, spread / 2 + tick_size)
//   bid/ask = mid -/+ spread / 2
//
// The floor keeps bid >= tick_size, so bid < ask holds for every generated
// quote.
//
// State is never reset: the sequence is not restartable. A fixed non-zero
// seed gives an identical sequence on every run.
//
// Thread model: not thread-safe. Owned and driven by one SyntheticQuoteSource.
// -----------------------------------------------------------------------------
class SyntheticQuoteGenerator {
 public:
  // seed == 0 draws a seed from std::random_device.
  SyntheticQuoteGenerator(const SyntheticSourceParams& params,
                          double tick_size,
                          std::uint64_t seed);

  domain::Quote next(std::int64_t timestamp_ms);

  double mid() const { return mid_; }
  double volatility() const { return volatility_; }
  std::uint64_t ticks() const { return ticks_; }

 private:
  double uniformCentered();  // U(-0.5, 0.5)

  const SyntheticSourceParams params_;
  const double tick_size_;

  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> unit_{0.0, 1.0};

  double mid_;
  double volatility_;
  double trend_{0.0};
  double phase_{0.0};
  std::uint64_t ticks_{0};
};

}  // namespace hft
