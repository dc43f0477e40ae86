#pragma once

#include "hft/config/pipeline_config.hpp"
#include "hft/domain/fill.hpp"
#include "hft/domain/position.hpp"

#include <cstdint>

namespace hft {

// -----------------------------------------------------------------------------
// PositionLedger — inventory and PnL of one instrument
// -----------------------------------------------------------------------------
//
// @brief  Folds fills into a domain::Position and reports PnL under the
//         configured PnlMethod.
//
// @details
// Both strategies keep one (their own exposure) and the RiskGate keeps one
// (for drawdown), so the two layers measure PnL independently from the same
// fill stream.
//
// applyFill() always maintains every Position field; pnl() selects the
// measure:
//   AverageCost → realized_pnl
//   CashFlow    → cash_flow
//
// PnL math (average cost):
//
//   Case 1 — Increasing position (fill in the same direction):
//     new_avg = (qty * avg + fill_qty * fill_price) / (qty + fill_qty)
//     realized_pnl unchanged.
//
//   Case 2 — Decreasing position (opposite direction, no reversal):
//     realized_pnl += |fill_qty| * (fill_price - avg) * sign(qty)
//     average_price unchanged.
//
//   Case 3 — Crossing zero:
//     realized_pnl += |qty| * (fill_price - avg) * sign(qty)
//     qty = sign(fill_qty) * (|fill_qty| - |qty|)
//     avg = fill_price
//
// Thread model: not thread-safe. Lives on the pipeline thread.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  explicit PositionLedger(PnlMethod method = PnlMethod::AverageCost)
      : method_(method) {}

  void applyFill(const domain::Fill& fill);

  const domain::Position& position() const { return position_; }
  double netQuantity() const { return position_.net_quantity; }

  // PnL under the configured method.
  double pnl() const;

  // Realized PnL plus the open position marked at `mark_price`. Average-cost
  // ledgers only; under CashFlow this is cash_flow + qty * mark_price.
  double markToMarket(double mark_price) const;

  std::uint64_t tradeCount() const { return trade_count_; }
  PnlMethod method() const { return method_; }

  // Core average-cost math, exposed for tests.
  static void applyFill(domain::Position& pos,
                        double signed_fill_qty,
                        double fill_price);

 private:
  const PnlMethod method_;
  domain::Position position_;
  std::uint64_t trade_count_{0};
};

}  // namespace hft
