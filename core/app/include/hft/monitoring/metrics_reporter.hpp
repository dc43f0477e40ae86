#pragma once

#include "hft/monitoring/i_metrics_sink.hpp"
#include "hft/monitoring/performance_monitor.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace hft {

// -----------------------------------------------------------------------------
// MetricsReporter — periodic snapshot flusher
// -----------------------------------------------------------------------------
//
// @brief  Every interval_ms, snapshots every registered PerformanceMonitor
//         and hands each snapshot to every sink.
//
// @details
// The reporter is the only component that looks at more than one pipeline,
// and it only ever reads their atomics. stop() wakes the thread
// immediately and performs one final flush, so the last numbers of a short
// run are never lost.
//
// Thread model:
//   addMonitor()/addSink() before start(). start()/stop() from the owning
//   thread (main). flush() may also be called directly when no thread is
//   running.
//
// Ownership:
//   Owns its sinks. Monitors are borrowed and must outlive the reporter's
//   thread.
// -----------------------------------------------------------------------------
class MetricsReporter {
 public:
  explicit MetricsReporter(std::chrono::milliseconds interval);

  // RAII: stop().
  ~MetricsReporter();

  MetricsReporter(const MetricsReporter&) = delete;
  MetricsReporter& operator=(const MetricsReporter&) = delete;

  void addMonitor(const PerformanceMonitor& monitor);
  void addSink(std::unique_ptr<IMetricsSink> sink);

  // Idempotent.
  void start();

  // Stops the thread and flushes once more. Idempotent.
  void stop();

  void flush();

  std::uint64_t flushCount() const;

 private:
  void run();

  const std::chrono::milliseconds interval_;

  std::vector<const PerformanceMonitor*> monitors_;
  std::vector<std::unique_ptr<IMetricsSink>> sinks_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  bool stop_requested_{false};
  std::uint64_t flushes_{0};

  std::thread thread_;
};

}  // namespace hft
