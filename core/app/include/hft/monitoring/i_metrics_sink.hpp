#pragma once

#include "hft/monitoring/performance_snapshot.hpp"

namespace hft {

// -----------------------------------------------------------------------------
// IMetricsSink — destination for periodic performance snapshots
// -----------------------------------------------------------------------------
// Called only from the MetricsReporter thread.
// -----------------------------------------------------------------------------
class IMetricsSink {
 public:
  virtual ~IMetricsSink() = default;

  virtual void publish(const PerformanceSnapshot& snapshot) = 0;
};

}  // namespace hft
