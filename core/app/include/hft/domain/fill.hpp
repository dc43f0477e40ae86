#pragma once

#include "hft/domain/order.hpp"

#include <cstdint>

namespace hft {
namespace domain {

// -----------------------------------------------------------------------------
// Fill
// -----------------------------------------------------------------------------
// Responsibility: Confirmation that all or part of an accepted Order traded.
//
// @details
// A venue may split one order into several fills. Each fill is a complete
// inventory update on its own; the venue guarantees that the quantities for
// one order_id sum to the order's quantity.
//
// order_id links the fill back to the in-flight order so the pipeline can
// tell when an admitted order has fully drained.
//
// rejected marks a terminal report instead of a trade: the venue failed to
// execute the order, quantity is zero and nothing moved. The pipeline then
// drops the order and releases its reservation at the RiskGate.
// -----------------------------------------------------------------------------
struct Fill {
  OrderId order_id{};
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  std::int64_t timestamp_ms{0};
  bool rejected{false};
};

}  // namespace domain
}  // namespace hft
