#include "hft/time/live_time_provider.hpp"
#include "hft/time/time_utils.hpp"

namespace hft {

std::int64_t LiveTimeProvider::now_ms() const { return wall_now_ms(); }

}  // namespace hft
