#include "hft/monitoring/log_metrics_sink.hpp"

#include <iomanip>
#include <sstream>

namespace hft {

void LogMetricsSink::publish(const PerformanceSnapshot& snapshot) {
  out_ << formatLine(snapshot) << "\n";
}

std::string LogMetricsSink::formatLine(const PerformanceSnapshot& s) {
  std::ostringstream line;
  line << std::fixed << std::setprecision(2);
  line << "[Metrics] " << s.instrument
       << " quotes=" << s.quotes_processed
       << " orders=" << s.orders_sent
       << " rejected=" << s.orders_rejected
       << " fills=" << s.fills_received
       << " breaker_trips=" << s.circuit_breaker_trips
       << " pnl=" << s.cumulative_pnl
       << " latency_avg_us=" << s.avg_latency_us
       << " latency_max_us=" << s.max_latency_us
       << " fill_latency_avg_us=" << s.avg_fill_latency_us
       << " fill_latency_max_us=" << s.max_fill_latency_us
       << " quotes_per_s=" << s.quotesPerSecond()
       << " orders_per_s=" << s.ordersPerSecond()
       << " uptime_s=" << std::setprecision(1) << s.uptime_seconds;
  return line.str();
}

}  // namespace hft
