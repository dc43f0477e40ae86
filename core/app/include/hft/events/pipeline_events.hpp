#pragma once

#include "hft/domain/fill.hpp"
#include "hft/domain/order.hpp"
#include "hft/domain/position.hpp"
#include "hft/risk/admission_decision.hpp"

#include <cstdint>
#include <string>

namespace hft {

// -----------------------------------------------------------------------------
// Pipeline events
// -----------------------------------------------------------------------------
//
// @brief  Notifications a Pipeline publishes on its EventBus after each
//         decision. Observers (logging, tests, the entry point) subscribe;
//         nothing on the trading path reads them back.
//
// @details
// timestamp_ms is the pipeline clock at the time of the decision (the
// quote's timestamp in simulated mode).
//
// Thread model:
//   Created and published on the pipeline thread. Plain data with value
//   semantics, safe to copy to another thread inside an Event.
// -----------------------------------------------------------------------------

// An order passed every RiskGate rule and was handed to the venue.
struct OrderAdmittedEvent {
  std::string symbol;
  domain::Order order;
  std::int64_t timestamp_ms{0};
};

// An order was refused. It is dropped; the strategy is not told.
struct OrderRejectedEvent {
  std::string symbol;
  domain::Order order;
  AdmissionDecision reason{AdmissionDecision::CircuitBreaker};
  std::int64_t timestamp_ms{0};
};

// A fill was folded into strategy and gate state.
//   position:       strategy position after the fill.
//   cumulative_pnl: the gate's PnL measure after the fill.
struct FillAppliedEvent {
  std::string symbol;
  domain::Fill fill;
  domain::Position position;
  double cumulative_pnl{0.0};
};

// The circuit breaker was tripped (or re-tripped, extending the expiry).
struct CircuitBreakerEvent {
  std::string symbol;
  TripReason reason{TripReason::None};
  std::int64_t tripped_at_ms{0};
  std::int64_t expiry_ms{0};
};

}  // namespace hft
