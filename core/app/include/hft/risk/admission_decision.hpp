#pragma once

namespace hft {

// -----------------------------------------------------------------------------
// AdmissionDecision
// -----------------------------------------------------------------------------
// Outcome of RiskGate::check(). Rejection values name the first rule that
// failed; rules are evaluated in declaration order after Accepted.
//
// DispatchFailed is never returned by the gate. The pipeline reports it when
// an admitted order could not be handed to the venue.
// -----------------------------------------------------------------------------
enum class AdmissionDecision {
  Accepted,
  CircuitBreaker,
  RateLimit,
  PositionLimit,
  OrderValue,
  DispatchFailed,
};

// What tripped the circuit breaker most recently.
enum class TripReason {
  None,
  PriceShock,
  Drawdown,
};

inline const char* toString(AdmissionDecision decision) {
  switch (decision) {
    case AdmissionDecision::Accepted:       return "Accepted";
    case AdmissionDecision::CircuitBreaker: return "CircuitBreaker";
    case AdmissionDecision::RateLimit:      return "RateLimit";
    case AdmissionDecision::PositionLimit:  return "PositionLimit";
    case AdmissionDecision::OrderValue:     return "OrderValue";
    case AdmissionDecision::DispatchFailed: return "DispatchFailed";
  }
  return "Unknown";
}

inline const char* toString(TripReason reason) {
  switch (reason) {
    case TripReason::None:       return "None";
    case TripReason::PriceShock: return "PriceShock";
    case TripReason::Drawdown:   return "Drawdown";
  }
  return "Unknown";
}

}  // namespace hft
