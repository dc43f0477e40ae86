#pragma once

#include <cstdint>

namespace hft {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" away from std::chrono::system_clock.
//
// @details
// The Risk Gate's rate window and circuit-breaker expiry are time rules. If
// they read the system clock directly, replaying a recorded quote stream
// would give different decisions on every run. Instead they read an
// ITimeProvider:
//
//   - LiveTimeProvider:       wall clock, for live pipelines.
//   - SimulationTimeProvider: set by the pipeline to each quote's timestamp,
//                             for backtests and tests.
//
// Ownership:
//   Components hold a const reference; they do not own the provider, which
//   must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Current time in milliseconds. Epoch-based for LiveTimeProvider; whatever
  // origin the quote stream uses for SimulationTimeProvider.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace hft
