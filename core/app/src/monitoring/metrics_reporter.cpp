#include "hft/monitoring/metrics_reporter.hpp"

#include <utility>

namespace hft {

MetricsReporter::MetricsReporter(std::chrono::milliseconds interval)
    : interval_(interval) {}

MetricsReporter::~MetricsReporter() { stop(); }

void MetricsReporter::addMonitor(const PerformanceMonitor& monitor) {
  monitors_.push_back(&monitor);
}

void MetricsReporter::addSink(std::unique_ptr<IMetricsSink> sink) {
  sinks_.push_back(std::move(sink));
}

void MetricsReporter::start() {
  if (thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop(): wake, join, final flush
// -----------------------------------------------------------------------------
void MetricsReporter::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();
  thread_.join();

  flush();
}

void MetricsReporter::flush() {
  for (const PerformanceMonitor* monitor : monitors_) {
    const PerformanceSnapshot snapshot = monitor->snapshot();
    for (auto& sink : sinks_) {
      sink->publish(snapshot);
    }
  }
  std::lock_guard lock(mutex_);
  ++flushes_;
}

std::uint64_t MetricsReporter::flushCount() const {
  std::lock_guard lock(mutex_);
  return flushes_;
}

void MetricsReporter::run() {
  std::unique_lock lock(mutex_);
  while (!stop_requested_) {
    if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    flush();
    lock.lock();
  }
}

}  // namespace hft
