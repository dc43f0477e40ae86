#include "hft/risk/order_tracker.hpp"

#include <algorithm>

namespace hft {

namespace {
constexpr double kRelativeEpsilon = 1e-9;
}  // namespace

void OrderTracker::track(const domain::Order& order,
                         std::int64_t dispatched_us) {
  active_[order.id] = Entry{order, order.quantity, dispatched_us};
}

// -----------------------------------------------------------------------------
// onFill(): reduce the open quantity; erase the order once complete
// -----------------------------------------------------------------------------
std::optional<OrderTracker::FillOutcome> OrderTracker::onFill(
    const domain::Fill& fill) {
  auto it = active_.find(fill.order_id);
  if (it == active_.end()) {
    return std::nullopt;
  }

  Entry& entry = it->second;
  entry.remaining -= fill.quantity;

  FillOutcome outcome;
  outcome.dispatched_us = entry.dispatched_us;
  outcome.completed =
      entry.remaining <= entry.order.quantity * kRelativeEpsilon;
  outcome.remaining = outcome.completed ? 0.0 : entry.remaining;

  if (outcome.completed) {
    active_.erase(it);
  }
  return outcome;
}

std::optional<double> OrderTracker::remaining(domain::OrderId id) const {
  auto it = active_.find(id);
  if (it == active_.end()) {
    return std::nullopt;
  }
  return it->second.remaining;
}

std::optional<OrderTracker::OpenOrder> OrderTracker::take(
    domain::OrderId id) {
  auto it = active_.find(id);
  if (it == active_.end()) {
    return std::nullopt;
  }
  OpenOrder open{it->second.order, it->second.remaining};
  active_.erase(it);
  return open;
}

std::vector<OrderTracker::OpenOrder> OrderTracker::abandonAll() {
  std::vector<OpenOrder> orders;
  orders.reserve(active_.size());
  for (const auto& [id, entry] : active_) {
    orders.push_back(OpenOrder{entry.order, entry.remaining});
  }
  std::sort(orders.begin(), orders.end(),
            [](const OpenOrder& a, const OpenOrder& b) {
              return a.order.id < b.order.id;
            });
  active_.clear();
  return orders;
}

}  // namespace hft
