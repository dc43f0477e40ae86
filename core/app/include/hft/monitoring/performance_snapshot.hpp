#pragma once

#include <cstdint>
#include <string>

namespace hft {

// -----------------------------------------------------------------------------
// PerformanceSnapshot — read-only copy of one pipeline's counters
// -----------------------------------------------------------------------------
// Produced by PerformanceMonitor::snapshot() and handed to metrics sinks.
// Latencies are in microseconds:
//   latency      — quote received to admission decision
//   fill latency — order dispatched to fill applied
// -----------------------------------------------------------------------------
struct PerformanceSnapshot {
  std::string instrument;
  std::uint64_t quotes_processed{0};
  std::uint64_t orders_sent{0};
  std::uint64_t orders_rejected{0};
  std::uint64_t fills_received{0};
  std::uint64_t circuit_breaker_trips{0};
  double cumulative_pnl{0.0};
  double avg_latency_us{0.0};
  std::int64_t max_latency_us{0};
  double avg_fill_latency_us{0.0};
  std::int64_t max_fill_latency_us{0};
  double uptime_seconds{0.0};

  double quotesPerSecond() const { return perSecond(quotes_processed); }
  double ordersPerSecond() const { return perSecond(orders_sent); }
  double fillsPerSecond() const { return perSecond(fills_received); }

 private:
  double perSecond(std::uint64_t count) const {
    return uptime_seconds > 0.0 ? static_cast<double>(count) / uptime_seconds
                                : 0.0;
  }
};

}  // namespace hft
