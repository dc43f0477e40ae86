#pragma once

#include "hft/monitoring/i_metrics_sink.hpp"

#include <iostream>
#include <ostream>
#include <string>

namespace hft {

// One line per snapshot, "[Metrics] <instrument> quotes=... orders=...".
class LogMetricsSink final : public IMetricsSink {
 public:
  explicit LogMetricsSink(std::ostream& out = std::cout) : out_(out) {}

  void publish(const PerformanceSnapshot& snapshot) override;

  static std::string formatLine(const PerformanceSnapshot& snapshot);

 private:
  std::ostream& out_;
};

}  // namespace hft
