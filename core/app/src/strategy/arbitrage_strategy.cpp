#include "hft/strategy/arbitrage_strategy.hpp"

#include <algorithm>
#include <cmath>

namespace hft {

namespace {
constexpr double kMinHeadroomFactor = 0.1;
constexpr double kMinLatencyFactor = 0.5;
constexpr double kMaxLatencyFactor = 1.5;
}  // namespace

ArbitrageStrategy::ArbitrageStrategy(const PipelineConfig& config,
                                     OrderIdGenerator& id_gen)
    : config_(config),
      params_(config.arbitrage),
      id_gen_(id_gen),
      ledger_(config.pnl_method) {}

// -----------------------------------------------------------------------------
// onQuote()
// -----------------------------------------------------------------------------
std::optional<domain::Order> ArbitrageStrategy::onQuote(
    const domain::Quote& quote) {
  ++quotes_processed_;
  recordInterval(quote.timestamp_ms);

  const double mid = quote.mid();
  const double inventory = ledger_.netQuantity();

  // Deviation is measured against the fair value before this mid is folded
  // into the EMA.
  const std::optional<double> fair = fair_value_;
  updateFairValue(mid);

  // --- Position-first override --------------------------------------------
  if (std::abs(inventory) >= params_.reduce_threshold * config_.max_position) {
    const domain::Side side =
        inventory > 0.0 ? domain::Side::Sell : domain::Side::Buy;
    return makeOrder(side, std::min(std::abs(inventory), params_.order_size),
                     quote);
  }

  if (!fair) {
    return std::nullopt;
  }

  const double deviation = mid - *fair;
  if (std::abs(deviation) <= params_.min_profit_threshold) {
    return std::nullopt;
  }

  const domain::Side side =
      deviation > 0.0 ? domain::Side::Sell : domain::Side::Buy;
  const double headroom = side == domain::Side::Buy
                              ? config_.max_position - inventory
                              : config_.max_position + inventory;
  if (headroom <= 0.0) {
    return std::nullopt;
  }

  const double multiplier =
      std::min(std::abs(deviation) / params_.min_profit_threshold,
               params_.max_size_multiplier);
  const double headroom_factor =
      std::max(headroom / config_.max_position, kMinHeadroomFactor);

  const double size = std::min(
      params_.order_size * multiplier * headroom_factor * latencyFactor(),
      headroom);
  if (size <= 0.0) {
    return std::nullopt;
  }
  return makeOrder(side, size, quote);
}

void ArbitrageStrategy::onFill(const domain::Fill& fill) {
  ledger_.applyFill(fill);
}

void ArbitrageStrategy::setFairValue(double fair_value) {
  external_fair_value_ = true;
  fair_value_ = fair_value;
}

// ---- private helpers ----

void ArbitrageStrategy::updateFairValue(double mid) {
  if (external_fair_value_) {
    return;
  }
  fair_value_ = fair_value_ ? params_.fair_value_alpha * mid +
                                  (1.0 - params_.fair_value_alpha) * *fair_value_
                            : mid;
}

void ArbitrageStrategy::recordInterval(std::int64_t timestamp_ms) {
  if (last_quote_ms_) {
    const std::int64_t interval = timestamp_ms - *last_quote_ms_;
    if (latency_.samples == 0) {
      latency_.min_interval_ms = interval;
      latency_.max_interval_ms = interval;
    } else {
      latency_.min_interval_ms = std::min(latency_.min_interval_ms, interval);
      latency_.max_interval_ms = std::max(latency_.max_interval_ms, interval);
    }
    latency_.avg_interval_ms =
        (latency_.avg_interval_ms * static_cast<double>(latency_.samples) +
         static_cast<double>(interval)) /
        static_cast<double>(latency_.samples + 1);
    latency_.last_interval_ms = interval;
    ++latency_.samples;
  }
  last_quote_ms_ = timestamp_ms;
}

double ArbitrageStrategy::latencyFactor() const {
  if (latency_.samples < 2 || latency_.last_interval_ms <= 0) {
    return 1.0;
  }
  return std::clamp(
      latency_.avg_interval_ms / static_cast<double>(latency_.last_interval_ms),
      kMinLatencyFactor, kMaxLatencyFactor);
}

domain::Order ArbitrageStrategy::makeOrder(domain::Side side, double quantity,
                                           const domain::Quote& quote) {
  domain::Order order;
  order.id = id_gen_.next_id();
  order.symbol = config_.symbol;
  order.side = side;
  order.quantity = quantity;
  order.price = side == domain::Side::Buy ? quote.ask : quote.bid;
  return order;
}

}  // namespace hft
