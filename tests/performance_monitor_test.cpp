// =============================================================================
// performance_monitor_test.cpp
// =============================================================================
// Unit tests for the monitoring path:
//   - hft::PerformanceMonitor counters, latency statistics and reset()
//   - hft::LogMetricsSink and hft::ZmqMetricsPublisher formatting
//   - hft::MetricsReporter periodic and final flushes
// =============================================================================

#include "hft/monitoring/i_metrics_sink.hpp"
#include "hft/monitoring/log_metrics_sink.hpp"
#include "hft/monitoring/metrics_reporter.hpp"
#include "hft/monitoring/performance_monitor.hpp"
#include "hft/monitoring/zmq_metrics_publisher.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace {

// Collects every snapshot published to it.
class RecordingSink final : public hft::IMetricsSink {
 public:
  explicit RecordingSink(std::vector<hft::PerformanceSnapshot>& out,
                         std::mutex& mutex)
      : out_(out), mutex_(mutex) {}

  void publish(const hft::PerformanceSnapshot& snapshot) override {
    std::lock_guard lock(mutex_);
    out_.push_back(snapshot);
  }

 private:
  std::vector<hft::PerformanceSnapshot>& out_;
  std::mutex& mutex_;
};

}  // namespace

TEST(PerformanceMonitorTest, CountersAndLatency) {
  hft::PerformanceMonitor monitor("XYZ");
  monitor.recordQuote();
  monitor.recordQuote();
  monitor.recordOrderSent();
  monitor.recordOrderRejected();
  monitor.recordFill();
  monitor.recordCircuitBreakerTrip();
  monitor.setCumulativePnl(-12.5);
  monitor.recordLatency(10);
  monitor.recordLatency(30);
  monitor.recordFillLatency(400);

  const auto s = monitor.snapshot();
  EXPECT_EQ(s.instrument, "XYZ");
  EXPECT_EQ(s.quotes_processed, 2u);
  EXPECT_EQ(s.orders_sent, 1u);
  EXPECT_EQ(s.orders_rejected, 1u);
  EXPECT_EQ(s.fills_received, 1u);
  EXPECT_EQ(s.circuit_breaker_trips, 1u);
  EXPECT_DOUBLE_EQ(s.cumulative_pnl, -12.5);
  EXPECT_DOUBLE_EQ(s.avg_latency_us, 20.0);
  EXPECT_EQ(s.max_latency_us, 30);
  EXPECT_DOUBLE_EQ(s.avg_fill_latency_us, 400.0);
  EXPECT_EQ(s.max_fill_latency_us, 400);
  EXPECT_GE(s.uptime_seconds, 0.0);
}

TEST(PerformanceMonitorTest, ResetClearsCounters) {
  hft::PerformanceMonitor monitor("XYZ");
  monitor.recordQuote();
  monitor.recordLatency(99);
  monitor.reset();

  const auto s = monitor.snapshot();
  EXPECT_EQ(s.quotes_processed, 0u);
  EXPECT_DOUBLE_EQ(s.avg_latency_us, 0.0);
  EXPECT_EQ(s.max_latency_us, 0);
}

TEST(PerformanceMonitorTest, ConcurrentRecordingLosesNothing) {
  hft::PerformanceMonitor monitor("XYZ");
  constexpr int kThreads = 4;
  constexpr int kPerThread = 10'000;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&monitor, t] {
      for (int i = 0; i < kPerThread; ++i) {
        monitor.recordQuote();
        monitor.recordLatency(t * kPerThread + i);
      }
    });
  }
  for (auto& t : threads) t.join();

  const auto s = monitor.snapshot();
  EXPECT_EQ(s.quotes_processed,
            static_cast<std::uint64_t>(kThreads * kPerThread));
  EXPECT_EQ(s.max_latency_us, kThreads * kPerThread - 1);
}

TEST(PerformanceSnapshotTest, RatesUseUptime) {
  hft::PerformanceSnapshot s;
  s.quotes_processed = 500;
  s.orders_sent = 50;
  s.fills_received = 25;
  EXPECT_DOUBLE_EQ(s.quotesPerSecond(), 0.0);

  s.uptime_seconds = 2.0;
  EXPECT_DOUBLE_EQ(s.quotesPerSecond(), 250.0);
  EXPECT_DOUBLE_EQ(s.ordersPerSecond(), 25.0);
  EXPECT_DOUBLE_EQ(s.fillsPerSecond(), 12.5);
}

TEST(LogMetricsSinkTest, FormatsOneLine) {
  hft::PerformanceSnapshot s;
  s.instrument = "ABC";
  s.quotes_processed = 10;
  s.orders_sent = 4;
  s.cumulative_pnl = 1.5;

  std::ostringstream out;
  hft::LogMetricsSink sink(out);
  sink.publish(s);

  const std::string line = out.str();
  EXPECT_EQ(line.rfind("[Metrics] ABC quotes=10 orders=4", 0), 0u);
  EXPECT_NE(line.find("pnl=1.50"), std::string::npos);
  EXPECT_EQ(line.back(), '\n');
}

TEST(ZmqMetricsPublisherTest, SnapshotIsJson) {
  hft::PerformanceSnapshot s;
  s.instrument = "XYZ";
  s.fills_received = 3;
  s.max_latency_us = 17;
  s.uptime_seconds = 1.0;

  const auto json =
      nlohmann::json::parse(hft::ZmqMetricsPublisher::formatSnapshot(s));
  EXPECT_EQ(json.at("type"), "performance");
  EXPECT_EQ(json.at("instrument"), "XYZ");
  EXPECT_EQ(json.at("fills_received").get<std::uint64_t>(), 3u);
  EXPECT_EQ(json.at("max_latency_us").get<std::int64_t>(), 17);
  EXPECT_DOUBLE_EQ(json.at("fills_per_second").get<double>(), 3.0);
}

// -----------------------------------------------------------------------------
// The reporter flushes on its interval and once more on stop(), so the last
// numbers always reach the sinks.
// -----------------------------------------------------------------------------
TEST(MetricsReporterTest, PeriodicAndFinalFlush) {
  hft::PerformanceMonitor a("A");
  hft::PerformanceMonitor b("B");
  std::vector<hft::PerformanceSnapshot> seen;
  std::mutex mutex;

  hft::MetricsReporter reporter(std::chrono::milliseconds(10));
  reporter.addMonitor(a);
  reporter.addMonitor(b);
  reporter.addSink(std::make_unique<RecordingSink>(seen, mutex));

  reporter.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  a.recordQuote();
  reporter.stop();

  EXPECT_GE(reporter.flushCount(), 2u);

  std::lock_guard lock(mutex);
  ASSERT_GE(seen.size(), 4u);
  EXPECT_EQ(seen.size() % 2, 0u);
  const auto& last_a = seen[seen.size() - 2];
  const auto& last_b = seen.back();
  EXPECT_EQ(last_a.instrument, "A");
  EXPECT_EQ(last_b.instrument, "B");
  EXPECT_EQ(last_a.quotes_processed, 1u);
}

TEST(MetricsReporterTest, StopWithoutStartIsNoOp) {
  hft::MetricsReporter reporter(std::chrono::milliseconds(10));
  reporter.stop();
  EXPECT_EQ(reporter.flushCount(), 0u);
}
