#pragma once

#include "hft/concurrent/order_id_generator.hpp"
#include "hft/config/pipeline_config.hpp"
#include "hft/risk/position_ledger.hpp"
#include "hft/strategy/i_strategy.hpp"

#include <cstdint>
#include <optional>

namespace hft {

// -----------------------------------------------------------------------------
// ArbitrageStrategy — fair-value deviation trading
// -----------------------------------------------------------------------------
//
// @brief  Crosses the spread when the mid strays more than
//         min_profit_threshold from a fair value.
//
// @details
// Fair value:
//   By default an EMA of the mid (weight fair_value_alpha on the newest
//   mid). The first quote only seeds it. Each later quote is compared with
//   the fair value BEFORE that quote's mid is folded in.
//   setFairValue() switches to an external reference (e.g. a correlated
//   instrument or an index) and stops the EMA. Until a fair value exists no
//   order is produced.
//
// Signal:
//   deviation = mid - fair
//   |deviation| > min_profit_threshold → Sell at bid when rich, Buy at ask
//   when cheap.
//
// Size:
//   order_size
//     * min(|deviation| / threshold, max_size_multiplier)
//     * max(headroom / max_position, 0.1)
//     * latency_factor
//   clipped to headroom. latency_factor = clamp(avg interval / last
//   interval, 0.5, 1.5) over quote-timestamp intervals: a burst of fast
//   quotes trades bigger. It is 1 until two intervals have been seen or
//   when the last interval is zero.
//
// Position-first override:
//   While |position| >= reduce_threshold * max_position, every quote emits a
//   reducing order (opposite the position, min(|position|, order_size)) at
//   the touch, whatever the deviation.
// -----------------------------------------------------------------------------
class ArbitrageStrategy final : public IStrategy {
 public:
  // Quote-interval statistics, in milliseconds.
  struct LatencyStats {
    std::uint64_t samples{0};
    std::int64_t min_interval_ms{0};
    std::int64_t max_interval_ms{0};
    std::int64_t last_interval_ms{0};
    double avg_interval_ms{0.0};
  };

  ArbitrageStrategy(const PipelineConfig& config, OrderIdGenerator& id_gen);

  ArbitrageStrategy(const ArbitrageStrategy&) = delete;
  ArbitrageStrategy& operator=(const ArbitrageStrategy&) = delete;

  std::optional<domain::Order> onQuote(const domain::Quote& quote) override;
  void onFill(const domain::Fill& fill) override;

  const domain::Position& position() const override {
    return ledger_.position();
  }
  double pnl() const override { return ledger_.pnl(); }
  std::uint64_t tradeCount() const override { return ledger_.tradeCount(); }
  const char* name() const override { return "arbitrage"; }

  // Uses `fair_value` from now on instead of the EMA.
  void setFairValue(double fair_value);

  std::optional<double> fairValue() const { return fair_value_; }
  const LatencyStats& latencyStats() const { return latency_; }
  std::uint64_t quotesProcessed() const { return quotes_processed_; }

 private:
  void updateFairValue(double mid);
  void recordInterval(std::int64_t timestamp_ms);
  double latencyFactor() const;
  domain::Order makeOrder(domain::Side side, double quantity,
                          const domain::Quote& quote);

  const PipelineConfig& config_;
  const ArbitrageParams& params_;
  OrderIdGenerator& id_gen_;

  std::optional<double> fair_value_;
  bool external_fair_value_{false};

  std::optional<std::int64_t> last_quote_ms_;
  LatencyStats latency_;

  PositionLedger ledger_;
  std::uint64_t quotes_processed_{0};
};

}  // namespace hft
