#pragma once

namespace hft {
namespace domain {

// -----------------------------------------------------------------------------
// Position — per-pipeline inventory and PnL state
// -----------------------------------------------------------------------------
//
// @brief  Net filled quantity, average entry price and PnL of one instrument.
//
// @details
// Sign convention for net_quantity:
//   positive → long, negative → short, zero → flat.
//
// average_price is the weighted average entry cost of the current position.
// It is re-averaged when the position grows, left alone when it shrinks, and
// reset to the fill price of the new-direction remainder when a fill crosses
// zero.
//
// realized_pnl accumulates profit/loss on closed quantity against
// average_price:
//   closed_qty * (fill_price - average_price) for longs
//   closed_qty * (average_price - fill_price) for shorts
//
// cash_flow is the running cash balance of all fills (sells add qty*px,
// buys subtract it). It is the PnL measure under PnlMethod::CashFlow.
//
// Value type. The authoritative copy lives in the strategy's PositionLedger;
// everyone else reads copies.
// -----------------------------------------------------------------------------
struct Position {
  double net_quantity{0.0};
  double average_price{0.0};
  double realized_pnl{0.0};
  double cash_flow{0.0};
};

}  // namespace domain
}  // namespace hft
