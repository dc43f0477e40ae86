#pragma once

#include <cstdint>
#include <string>

namespace hft {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Unique identifier of an order within one pipeline. Handed out by
// OrderIdGenerator starting at 1; 0 means "unset".
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// Signed quantity of a trade in position terms: +qty for Buy, -qty for Sell.
inline double signedQuantity(Side side, double quantity) {
  return side == Side::Buy ? quantity : -quantity;
}

inline Side opposite(Side side) {
  return side == Side::Buy ? Side::Sell : Side::Buy;
}

inline const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: A strategy's request to trade `quantity` at `price`.
//
// @details
// Created by a strategy for one quote, consumed exactly once by the Risk
// Gate. A rejected order is discarded (never retried); an accepted one is
// owned by the venue until fills totalling `quantity` come back.
//
// Invariants (enforced by the strategies that create orders):
//   quantity > 0, price > 0.
//
// Value type: safe to copy between the pipeline and venue threads.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};          // Assigned by the strategy from OrderIdGenerator
  std::string symbol;    // Instrument this pipeline trades
  Side side{Side::Buy};
  double quantity{0.0};  // Positive size
  double price{0.0};     // Positive limit price

  // Notional checked against max_order_value.
  double notional() const { return quantity * price; }
};

}  // namespace domain
}  // namespace hft
