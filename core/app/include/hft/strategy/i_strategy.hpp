#pragma once

#include "hft/domain/fill.hpp"
#include "hft/domain/order.hpp"
#include "hft/domain/position.hpp"
#include "hft/domain/quote.hpp"

#include <cstdint>
#include <optional>

namespace hft {

// -----------------------------------------------------------------------------
// IStrategy — pluggable order-generation policy
// -----------------------------------------------------------------------------
//
// @brief  Turns quotes into at most one order per quote, and folds fills
//         into its own inventory.
//
// @details
// A strategy is chosen once, when the pipeline is built (makeStrategy()),
// and never inspected for its concrete type afterwards.
//
// The strategy's position is the single source of truth for its exposure.
// The RiskGate keeps its own reservation-based position and enforces the
// hard limits independently; a strategy never assumes its order will be
// admitted.
//
// Thread model: every call happens on the pipeline thread.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  // Returns an order for this quote, or std::nullopt to stay out.
  virtual std::optional<domain::Order> onQuote(const domain::Quote& quote) = 0;

  // Applies a (possibly partial) fill to inventory and PnL.
  virtual void onFill(const domain::Fill& fill) = 0;

  virtual const domain::Position& position() const = 0;

  // PnL under the configured PnlMethod.
  virtual double pnl() const = 0;

  virtual std::uint64_t tradeCount() const = 0;

  virtual const char* name() const = 0;
};

}  // namespace hft
