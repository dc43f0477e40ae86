#pragma once

#include "hft/concurrent/order_id_generator.hpp"
#include "hft/config/pipeline_config.hpp"
#include "hft/risk/position_ledger.hpp"
#include "hft/strategy/i_strategy.hpp"

#include <cstddef>
#include <deque>

namespace hft {

// -----------------------------------------------------------------------------
// MarketMakingStrategy — inventory-aware single-sided quoting
// -----------------------------------------------------------------------------
//
// @brief  Quotes one side per tick around a skewed mid, widening with
//         volatility and leaning against inventory.
//
// @details
// Per quote:
//   1. Push mid into the rolling window (volatility_window quotes).
//      vol = stddev(window) / mean(window), 0 with fewer than two samples.
//   2. half_spread = max(base_spread * (1 + k * vol), min_spread) / 2
//      base_spread defaults to 2 ticks, min_spread to 1 tick.
//   3. deviation = inventory - target_inventory
//      shift     = -(deviation / max_position) * skew_factor * base_spread
//      skewed    = mid + shift
//   4. Side: Sell above target + band, Buy below target - band, otherwise
//      alternate Buy/Sell tick by tick (starting with Buy).
//   5. Price: skewed -/+ half_spread for Buy/Sell, rounded to tick_size.
//      A non-positive price means no order.
//   6. Size: order_size, reduced by up to 50% (proportional to
//      |deviation| / max_position) when the order would move inventory
//      further from target, then clipped to the headroom under
//      max_position. No headroom means no order.
//
// Inventory and PnL live in a PositionLedger; inventory only changes on
// fills.
// -----------------------------------------------------------------------------
class MarketMakingStrategy final : public IStrategy {
 public:
  MarketMakingStrategy(const PipelineConfig& config, OrderIdGenerator& id_gen);

  MarketMakingStrategy(const MarketMakingStrategy&) = delete;
  MarketMakingStrategy& operator=(const MarketMakingStrategy&) = delete;

  std::optional<domain::Order> onQuote(const domain::Quote& quote) override;
  void onFill(const domain::Fill& fill) override;

  const domain::Position& position() const override {
    return ledger_.position();
  }
  double pnl() const override { return ledger_.pnl(); }
  std::uint64_t tradeCount() const override { return ledger_.tradeCount(); }
  const char* name() const override { return "market_making"; }

  // Relative volatility of the current mid window.
  double volatility() const;
  double baseSpread() const { return base_spread_; }
  double minSpread() const { return min_spread_; }
  std::uint64_t quotesReceived() const { return quotes_received_; }

 private:
  double roundToTick(double price) const;

  const PipelineConfig& config_;
  const MarketMakingParams& params_;
  OrderIdGenerator& id_gen_;

  const double base_spread_;
  const double min_spread_;

  std::deque<double> mids_;
  domain::Side next_side_{domain::Side::Buy};
  PositionLedger ledger_;
  std::uint64_t quotes_received_{0};
};

}  // namespace hft
