#pragma once

#include "hft/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace hft {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  A clock that only moves when told to.
//
// @details
// In simulated-clock mode the pipeline calls advance_time(quote.timestamp_ms)
// before it hands each quote to the Risk Gate, so every time-based rule sees
// the quote's own time. Tests drive it directly to step through rate windows
// and circuit-breaker durations without sleeping.
//
// Each pipeline owns its own instance: instruments never share a simulated
// clock.
//
// Thread-safety: now_ms() and advance_time() are atomic. The intended usage
// is single-writer (the pipeline thread).
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Monotonicity is the caller's responsibility; quote sources emit
  // timestamps in order.
  void advance_time(std::int64_t new_time_ms);

  // Convenience for tests: moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace hft
