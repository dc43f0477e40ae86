#pragma once

#include "hft/domain/fill.hpp"
#include "hft/domain/order.hpp"

#include <vector>

namespace hft {

// -----------------------------------------------------------------------------
// IExecutionVenue — abstract order execution endpoint
// -----------------------------------------------------------------------------
//
// @brief  Executes one admitted order and reports the resulting fills.
//
// @details
// Contract:
//   - execute() returns one or more fills for the order, in the order they
//     happened. Their quantities sum to order.quantity; each carries
//     order.id and order.side.
//   - The venue never rejects: admission control is the RiskGate's job.
//
// Implementations: SimulatedVenue. A live adapter implements the same
// interface and is swapped in by InstrumentEngine without touching the
// pipeline.
//
// Thread model:
//   Called only from the VenueThread that owns the venue.
// -----------------------------------------------------------------------------
class IExecutionVenue {
 public:
  virtual ~IExecutionVenue() = default;

  virtual std::vector<domain::Fill> execute(const domain::Order& order) = 0;
};

}  // namespace hft
