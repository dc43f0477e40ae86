#pragma once

#include "hft/domain/order.hpp"

#include <atomic>

namespace hft {

// -----------------------------------------------------------------------------
// OrderIdGenerator — monotonically increasing order ID source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique, increasing order IDs starting at 1. ID 0 is the
//         "unset" sentinel on domain::Order.
//
// @details
// Each pipeline owns its own generator and injects it into its strategy by
// reference, so two freshly built pipelines hand out identical ID sequences
// (replays are deterministic). No process-wide singleton.
//
// The counter is atomic so a strategy and a test harness may share one
// generator across threads; relaxed ordering is enough because only
// uniqueness is required.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  domain::OrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::OrderId> next_id_{1};
};

}  // namespace hft
