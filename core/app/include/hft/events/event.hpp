#pragma once

#include "hft/events/pipeline_events.hpp"

#include <variant>

namespace hft {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by EventBus. Subscribers dispatch with
// std::visit or the typed EventBus::subscribe<T>().
// -----------------------------------------------------------------------------
using Event = std::variant<
    OrderAdmittedEvent,
    OrderRejectedEvent,
    FillAppliedEvent,
    CircuitBreakerEvent>;

}  // namespace hft
