#include "hft/monitoring/performance_monitor.hpp"

#include <utility>

namespace hft {

PerformanceMonitor::PerformanceMonitor(std::string instrument)
    : instrument_(std::move(instrument)),
      start_(std::chrono::steady_clock::now()) {}

void PerformanceMonitor::recordLatency(std::int64_t latency_us) {
  decision_latency_.record(latency_us);
}

void PerformanceMonitor::recordFillLatency(std::int64_t latency_us) {
  fill_latency_.record(latency_us);
}

// -----------------------------------------------------------------------------
// snapshot(): one atomic load per field
// -----------------------------------------------------------------------------
PerformanceSnapshot PerformanceMonitor::snapshot() const {
  PerformanceSnapshot s;
  s.instrument = instrument_;
  s.quotes_processed = quotes_.load(std::memory_order_relaxed);
  s.orders_sent = orders_sent_.load(std::memory_order_relaxed);
  s.orders_rejected = orders_rejected_.load(std::memory_order_relaxed);
  s.fills_received = fills_.load(std::memory_order_relaxed);
  s.circuit_breaker_trips = breaker_trips_.load(std::memory_order_relaxed);
  s.cumulative_pnl = pnl_.load(std::memory_order_relaxed);
  s.avg_latency_us = decision_latency_.average();
  s.max_latency_us = decision_latency_.max_us.load(std::memory_order_relaxed);
  s.avg_fill_latency_us = fill_latency_.average();
  s.max_fill_latency_us = fill_latency_.max_us.load(std::memory_order_relaxed);
  s.uptime_seconds = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - start_)
                         .count();
  return s;
}

void PerformanceMonitor::reset() {
  quotes_.store(0, std::memory_order_relaxed);
  orders_sent_.store(0, std::memory_order_relaxed);
  orders_rejected_.store(0, std::memory_order_relaxed);
  fills_.store(0, std::memory_order_relaxed);
  breaker_trips_.store(0, std::memory_order_relaxed);
  pnl_.store(0.0, std::memory_order_relaxed);
  decision_latency_.reset();
  fill_latency_.reset();
}

// ---- LatencyStat ----

void PerformanceMonitor::LatencyStat::record(std::int64_t latency_us) {
  sum_us.fetch_add(latency_us, std::memory_order_relaxed);
  count.fetch_add(1, std::memory_order_relaxed);

  std::int64_t current = max_us.load(std::memory_order_relaxed);
  while (latency_us > current &&
         !max_us.compare_exchange_weak(current, latency_us,
                                       std::memory_order_relaxed)) {
  }
}

double PerformanceMonitor::LatencyStat::average() const {
  const std::uint64_t n = count.load(std::memory_order_relaxed);
  if (n == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_us.load(std::memory_order_relaxed)) /
         static_cast<double>(n);
}

void PerformanceMonitor::LatencyStat::reset() {
  sum_us.store(0, std::memory_order_relaxed);
  count.store(0, std::memory_order_relaxed);
  max_us.store(0, std::memory_order_relaxed);
}

}  // namespace hft
