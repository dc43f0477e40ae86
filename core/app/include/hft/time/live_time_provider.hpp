#pragma once

#include "hft/time/i_time_provider.hpp"

namespace hft {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time source
// -----------------------------------------------------------------------------
// Delegates to std::chrono::system_clock. Stateless, so one instance may be
// shared by every live pipeline in the process.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace hft
