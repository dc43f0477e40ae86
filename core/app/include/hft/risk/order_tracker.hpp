#pragma once

#include "hft/domain/fill.hpp"
#include "hft/domain/order.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace hft {

// -----------------------------------------------------------------------------
// OrderTracker — admitted orders awaiting fills
// -----------------------------------------------------------------------------
//
// @brief  Remembers every order the RiskGate admitted until fills for its
//         full quantity have come back.
//
// @details
// The pipeline uses it for two things:
//   1. Shutdown: run() only finishes once inFlight() is zero (or the drain
//      timeout abandons the rest).
//   2. Fill latency: the dispatch time stored with each order gives the
//      decision-to-fill latency of every fill.
//
// An order is complete once the remaining quantity drops to within a
// relative epsilon of zero, so split fills that sum to the order quantity
// up to rounding still complete it.
//
// Fills for unknown order ids are reported as such and otherwise ignored.
//
// Thread model: not thread-safe. Lives on the pipeline thread.
// -----------------------------------------------------------------------------
class OrderTracker {
 public:
  struct FillOutcome {
    double remaining{0.0};          // quantity still open after this fill
    bool completed{false};          // this fill closed the order
    std::int64_t dispatched_us{0};  // steady-clock dispatch time of the order
  };

  // An order dropped before its fills completed it.
  struct OpenOrder {
    domain::Order order;
    double remaining{0.0};
  };

  OrderTracker() = default;

  OrderTracker(const OrderTracker&) = delete;
  OrderTracker& operator=(const OrderTracker&) = delete;

  // Registers an admitted order. dispatched_us is a steady-clock timestamp.
  void track(const domain::Order& order, std::int64_t dispatched_us);

  // Applies a fill. std::nullopt if the order id is not in flight.
  std::optional<FillOutcome> onFill(const domain::Fill& fill);

  // Forgets one order without a fill, e.g. when it could not be dispatched.
  // Returns false if it was not in flight.
  bool erase(domain::OrderId id) { return active_.erase(id) != 0; }

  // Removes one order and returns it with its unfilled quantity, e.g. after
  // the venue rejected it. std::nullopt if it was not in flight.
  std::optional<OpenOrder> take(domain::OrderId id);

  std::size_t inFlight() const { return active_.size(); }
  bool isInFlight(domain::OrderId id) const { return active_.count(id) != 0; }

  // std::nullopt if the order is not in flight.
  std::optional<double> remaining(domain::OrderId id) const;

  // Drops every in-flight order and returns them with their unfilled
  // quantity, oldest id first.
  std::vector<OpenOrder> abandonAll();

 private:
  struct Entry {
    domain::Order order;
    double remaining{0.0};
    std::int64_t dispatched_us{0};
  };

  std::unordered_map<domain::OrderId, Entry> active_;
};

}  // namespace hft
