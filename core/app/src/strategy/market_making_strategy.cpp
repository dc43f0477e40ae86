#include "hft/strategy/market_making_strategy.hpp"

#include <algorithm>
#include <cmath>

namespace hft {

MarketMakingStrategy::MarketMakingStrategy(const PipelineConfig& config,
                                           OrderIdGenerator& id_gen)
    : config_(config),
      params_(config.market_making),
      id_gen_(id_gen),
      base_spread_(params_.base_spread > 0.0 ? params_.base_spread
                                             : 2.0 * config.tick_size),
      min_spread_(params_.min_spread > 0.0 ? params_.min_spread
                                           : config.tick_size),
      ledger_(config.pnl_method) {}

// -----------------------------------------------------------------------------
// onQuote(): one order per quote at most
// -----------------------------------------------------------------------------
std::optional<domain::Order> MarketMakingStrategy::onQuote(
    const domain::Quote& quote) {
  ++quotes_received_;

  const double mid = quote.mid();
  mids_.push_back(mid);
  if (mids_.size() > params_.volatility_window) {
    mids_.pop_front();
  }

  // --- Spread -----------------------------------------------------------------
  const double vol = volatility();
  const double full_spread = std::max(
      base_spread_ * (1.0 + params_.volatility_sensitivity * vol), min_spread_);
  const double half_spread = full_spread / 2.0;

  // --- Inventory skew ---------------------------------------------------------
  const double inventory = ledger_.netQuantity();
  const double deviation = inventory - params_.target_inventory;
  const double normalized = deviation / config_.max_position;
  const double skewed_mid =
      mid - normalized * params_.skew_factor * base_spread_;

  // --- Side -------------------------------------------------------------------
  domain::Side side;
  if (deviation > params_.inventory_band) {
    side = domain::Side::Sell;
  } else if (deviation < -params_.inventory_band) {
    side = domain::Side::Buy;
  } else {
    side = next_side_;
    next_side_ = domain::opposite(next_side_);
  }

  const double price = roundToTick(side == domain::Side::Buy
                                       ? skewed_mid - half_spread
                                       : skewed_mid + half_spread);
  if (price <= 0.0) {
    return std::nullopt;
  }

  // --- Size -------------------------------------------------------------------
  double size = params_.order_size;
  if (domain::signedQuantity(side, 1.0) * deviation > 0.0) {
    size *= 1.0 - std::min(std::abs(normalized), 1.0) * 0.5;
  }
  const double headroom = side == domain::Side::Buy
                              ? config_.max_position - inventory
                              : config_.max_position + inventory;
  size = std::min(size, headroom);
  if (size <= 0.0) {
    return std::nullopt;
  }

  domain::Order order;
  order.id = id_gen_.next_id();
  order.symbol = config_.symbol;
  order.side = side;
  order.quantity = size;
  order.price = price;
  return order;
}

void MarketMakingStrategy::onFill(const domain::Fill& fill) {
  ledger_.applyFill(fill);
}

double MarketMakingStrategy::volatility() const {
  if (mids_.size() < 2) {
    return 0.0;
  }

  double sum = 0.0;
  for (double m : mids_) {
    sum += m;
  }
  const double mean = sum / static_cast<double>(mids_.size());
  if (mean <= 0.0) {
    return 0.0;
  }

  double variance = 0.0;
  for (double m : mids_) {
    variance += (m - mean) * (m - mean);
  }
  variance /= static_cast<double>(mids_.size());

  return std::sqrt(variance) / mean;
}

double MarketMakingStrategy::roundToTick(double price) const {
  return std::round(price / config_.tick_size) * config_.tick_size;
}

}  // namespace hft
