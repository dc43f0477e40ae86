#pragma once

#include <chrono>
#include <cstdint>

namespace hft {

// Monotonic microseconds for latency measurement. Never used for trading
// decisions, only for PerformanceMonitor statistics.
inline std::int64_t steady_now_us() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

// Wall-clock epoch milliseconds, used to stamp quotes in live mode.
inline std::int64_t wall_now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace hft
