#pragma once

#include <cstdint>

namespace hft {
namespace domain {

// -----------------------------------------------------------------------------
// Quote
// -----------------------------------------------------------------------------
// Responsibility: The observable market for one instrument at one instant.
//
// @details
// Produced by a quote source (synthetic generator or feed gateway) and never
// mutated afterwards. The Risk Gate and the strategy both read it.
//
// Invariant: bid < ask. Sources that cannot guarantee it (e.g. the ZeroMQ
// gateway) drop offending quotes with isValid() before they reach a channel.
//
// timestamp_ms is epoch milliseconds in live mode and simulated milliseconds
// in backtests. All time-based risk rules key off it (through the clock the
// pipeline advances), which keeps replays deterministic.
// -----------------------------------------------------------------------------
struct Quote {
  double bid{0.0};
  double ask{0.0};
  std::int64_t timestamp_ms{0};

  double mid() const { return (bid + ask) / 2.0; }
  double spread() const { return ask - bid; }
  bool isValid() const { return bid > 0.0 && bid < ask; }
};

}  // namespace domain
}  // namespace hft
