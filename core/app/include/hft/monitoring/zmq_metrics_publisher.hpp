#pragma once

#include "hft/monitoring/i_metrics_sink.hpp"

#include <zmq.hpp>

#include <string>

namespace hft {

// -----------------------------------------------------------------------------
// ZmqMetricsPublisher — JSON snapshots on a ZeroMQ PUB socket
// -----------------------------------------------------------------------------
//
// @brief  Binds a PUB socket and sends one JSON document per snapshot, for
//         an external dashboard or recorder.
//
// @details
// Message format:
//   {
//     "type": "performance", "instrument": "XYZ",
//     "quotes_processed": 1000, "orders_sent": 480, "orders_rejected": 20,
//     "fills_received": 530, "circuit_breaker_trips": 0,
//     "cumulative_pnl": 12.5,
//     "avg_latency_us": 3.2, "max_latency_us": 41,
//     "avg_fill_latency_us": 55.0, "max_fill_latency_us": 300,
//     "uptime_seconds": 10.0, "quotes_per_second": 100.0,
//     "orders_per_second": 48.0, "fills_per_second": 53.0
//   }
//
// Sends use ZMQ_DONTWAIT: with no subscriber, or a slow one, snapshots are
// dropped instead of stalling the reporter.
//
// Ownership: owns the zmq::context_t and zmq::socket_t (RAII).
// -----------------------------------------------------------------------------
class ZmqMetricsPublisher final : public IMetricsSink {
 public:
  // @throws zmq::error_t if the endpoint cannot be bound.
  explicit ZmqMetricsPublisher(const std::string& endpoint);

  ZmqMetricsPublisher(const ZmqMetricsPublisher&) = delete;
  ZmqMetricsPublisher& operator=(const ZmqMetricsPublisher&) = delete;

  void publish(const PerformanceSnapshot& snapshot) override;

  static std::string formatSnapshot(const PerformanceSnapshot& snapshot);

 private:
  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::pub};
};

}  // namespace hft
