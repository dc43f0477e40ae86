#include "hft/monitoring/zmq_metrics_publisher.hpp"

#include <nlohmann/json.hpp>

namespace hft {

ZmqMetricsPublisher::ZmqMetricsPublisher(const std::string& endpoint) {
  socket_.bind(endpoint);
}

void ZmqMetricsPublisher::publish(const PerformanceSnapshot& snapshot) {
  const std::string payload = formatSnapshot(snapshot);
  zmq::message_t msg(payload.data(), payload.size());
  // No subscriber, or a full pipe: drop this snapshot, the next one follows.
  (void)socket_.send(msg, zmq::send_flags::dontwait);
}

// -----------------------------------------------------------------------------
// formatSnapshot()
// -----------------------------------------------------------------------------
std::string ZmqMetricsPublisher::formatSnapshot(const PerformanceSnapshot& s) {
  nlohmann::json j;
  j["type"] = "performance";
  j["instrument"] = s.instrument;
  j["quotes_processed"] = s.quotes_processed;
  j["orders_sent"] = s.orders_sent;
  j["orders_rejected"] = s.orders_rejected;
  j["fills_received"] = s.fills_received;
  j["circuit_breaker_trips"] = s.circuit_breaker_trips;
  j["cumulative_pnl"] = s.cumulative_pnl;
  j["avg_latency_us"] = s.avg_latency_us;
  j["max_latency_us"] = s.max_latency_us;
  j["avg_fill_latency_us"] = s.avg_fill_latency_us;
  j["max_fill_latency_us"] = s.max_fill_latency_us;
  j["uptime_seconds"] = s.uptime_seconds;
  j["quotes_per_second"] = s.quotesPerSecond();
  j["orders_per_second"] = s.ordersPerSecond();
  j["fills_per_second"] = s.fillsPerSecond();
  return j.dump();
}

}  // namespace hft
