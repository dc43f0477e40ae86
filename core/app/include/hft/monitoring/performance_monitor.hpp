#pragma once

#include "hft/monitoring/performance_snapshot.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace hft {

// -----------------------------------------------------------------------------
// PerformanceMonitor — lock-free per-pipeline counters
// -----------------------------------------------------------------------------
//
// @brief  Counts what one pipeline does and how fast, for observability only.
//
// @details
// Written by the pipeline thread, read by the MetricsReporter thread. Every
// field is an independent atomic, so snapshot() never blocks the writer and
// never sees a torn value. A snapshot taken while the pipeline is running
// may mix counters from adjacent events; each field on its own is exact.
//
// Nothing on the trading path reads the monitor back.
//
// reset() clears every counter but keeps the start time, so uptime keeps
// growing.
// -----------------------------------------------------------------------------
class PerformanceMonitor {
 public:
  explicit PerformanceMonitor(std::string instrument);

  PerformanceMonitor(const PerformanceMonitor&) = delete;
  PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

  void recordQuote() { quotes_.fetch_add(1, std::memory_order_relaxed); }
  void recordOrderSent() { orders_sent_.fetch_add(1, std::memory_order_relaxed); }
  void recordOrderRejected() {
    orders_rejected_.fetch_add(1, std::memory_order_relaxed);
  }
  void recordFill() { fills_.fetch_add(1, std::memory_order_relaxed); }
  void recordCircuitBreakerTrip() {
    breaker_trips_.fetch_add(1, std::memory_order_relaxed);
  }

  // The pipeline publishes the gate's cumulative PnL after every fill.
  void setCumulativePnl(double pnl) {
    pnl_.store(pnl, std::memory_order_relaxed);
  }

  // Quote-to-decision latency.
  void recordLatency(std::int64_t latency_us);

  // Dispatch-to-fill latency.
  void recordFillLatency(std::int64_t latency_us);

  PerformanceSnapshot snapshot() const;

  void reset();

  const std::string& instrument() const { return instrument_; }

 private:
  struct LatencyStat {
    std::atomic<std::int64_t> sum_us{0};
    std::atomic<std::uint64_t> count{0};
    std::atomic<std::int64_t> max_us{0};

    void record(std::int64_t latency_us);
    double average() const;
    void reset();
  };

  const std::string instrument_;
  const std::chrono::steady_clock::time_point start_;

  std::atomic<std::uint64_t> quotes_{0};
  std::atomic<std::uint64_t> orders_sent_{0};
  std::atomic<std::uint64_t> orders_rejected_{0};
  std::atomic<std::uint64_t> fills_{0};
  std::atomic<std::uint64_t> breaker_trips_{0};
  std::atomic<double> pnl_{0.0};

  LatencyStat decision_latency_;
  LatencyStat fill_latency_;
};

}  // namespace hft
