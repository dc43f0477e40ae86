#include "hft/risk/position_ledger.hpp"

#include <cmath>

namespace hft {

// ---- applyFill(Fill) ----
void PositionLedger::applyFill(const domain::Fill& fill) {
  const double signed_qty = domain::signedQuantity(fill.side, fill.quantity);

  applyFill(position_, signed_qty, fill.price);
  position_.cash_flow -= signed_qty * fill.price;
  ++trade_count_;
}

double PositionLedger::pnl() const {
  return method_ == PnlMethod::CashFlow ? position_.cash_flow
                                        : position_.realized_pnl;
}

double PositionLedger::markToMarket(double mark_price) const {
  if (method_ == PnlMethod::CashFlow) {
    return position_.cash_flow + position_.net_quantity * mark_price;
  }
  return position_.realized_pnl +
         position_.net_quantity * (mark_price - position_.average_price);
}

// ---- applyFill(Position&, ...) : average-cost math ----
void PositionLedger::applyFill(domain::Position& pos,
                               double signed_fill_qty,
                               double fill_price) {
  const double current_qty = pos.net_quantity;

  if (current_qty == 0.0) {
    pos.net_quantity = signed_fill_qty;
    pos.average_price = fill_price;
    return;
  }

  const bool same_direction = (current_qty > 0.0 && signed_fill_qty > 0.0) ||
                              (current_qty < 0.0 && signed_fill_qty < 0.0);

  if (same_direction) {
    const double new_total = current_qty + signed_fill_qty;
    pos.average_price =
        (current_qty * pos.average_price + signed_fill_qty * fill_price) /
        new_total;
    pos.net_quantity = new_total;
    return;
  }

  const double abs_current = std::abs(current_qty);
  const double abs_fill = std::abs(signed_fill_qty);
  const double direction_sign = (current_qty > 0.0) ? 1.0 : -1.0;

  if (abs_fill <= abs_current) {
    pos.realized_pnl +=
        abs_fill * (fill_price - pos.average_price) * direction_sign;
    pos.net_quantity = current_qty + signed_fill_qty;
    if (pos.net_quantity == 0.0) {
      pos.average_price = 0.0;
    }
    return;
  }

  // Reversal: close everything, open the remainder at the fill price.
  pos.realized_pnl +=
      abs_current * (fill_price - pos.average_price) * direction_sign;
  const double new_direction_sign = (signed_fill_qty > 0.0) ? 1.0 : -1.0;
  pos.net_quantity = new_direction_sign * (abs_fill - abs_current);
  pos.average_price = fill_price;
}

}  // namespace hft
