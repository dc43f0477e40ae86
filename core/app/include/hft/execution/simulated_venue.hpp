#pragma once

#include "hft/config/pipeline_config.hpp"
#include "hft/execution/i_execution_venue.hpp"
#include "hft/time/i_time_provider.hpp"

#include <random>

namespace hft {

// -----------------------------------------------------------------------------
// SimulatedVenue — stochastic fill model for backtests and demos
// -----------------------------------------------------------------------------
//
// @brief  Fills every order in full, with slippage and occasional splits.
//
// @details
// Slippage (fraction of the order price):
//   with probability shock_slippage_probability:
//     U(-0.5, 0.5) * shock_slippage_max              (symmetric shock)
//   otherwise:
//     quantity * impact_per_unit, against the trader  (size impact)
//   fill_price = order.price * (1 + slippage), floored at a positive value.
//
// Splits: with probability split_probability the order is filled in two
// parts, the first U(0.1, 0.9) of the quantity and the second the rest.
//
// fill_latency_ms > 0 makes execute() sleep before returning, standing in
// for the venue round trip.
//
// Fills are stamped with the injected clock. A fixed non-zero seed makes
// the fill sequence for a given order sequence reproducible.
// -----------------------------------------------------------------------------
class SimulatedVenue final : public IExecutionVenue {
 public:
  SimulatedVenue(const VenueParams& params, const ITimeProvider& clock);

  SimulatedVenue(const SimulatedVenue&) = delete;
  SimulatedVenue& operator=(const SimulatedVenue&) = delete;

  std::vector<domain::Fill> execute(const domain::Order& order) override;

 private:
  double fillPrice(const domain::Order& order);

  const VenueParams params_;
  const ITimeProvider& clock_;

  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

}  // namespace hft
