#include "hft/execution/simulated_venue.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace hft {

namespace {
constexpr double kMinSplitFraction = 0.1;
constexpr double kMaxSplitFraction = 0.9;
constexpr double kMinPriceFraction = 1e-6;
}  // namespace

SimulatedVenue::SimulatedVenue(const VenueParams& params,
                               const ITimeProvider& clock)
    : params_(params), clock_(clock), rng_(resolveSeed(params.seed)) {}

// -----------------------------------------------------------------------------
// execute(): one or two fills summing to the order quantity
// -----------------------------------------------------------------------------
std::vector<domain::Fill> SimulatedVenue::execute(const domain::Order& order) {
  if (params_.fill_latency_ms > 0) {
    std::this_thread::sleep_for(
        std::chrono::milliseconds(params_.fill_latency_ms));
  }

  const double price = fillPrice(order);
  const std::int64_t now = clock_.now_ms();

  auto makeFill = [&](double quantity) {
    domain::Fill fill;
    fill.order_id = order.id;
    fill.side = order.side;
    fill.quantity = quantity;
    fill.price = price;
    fill.timestamp_ms = now;
    return fill;
  };

  std::vector<domain::Fill> fills;
  if (unit_(rng_) < params_.split_probability) {
    const double fraction =
        kMinSplitFraction + unit_(rng_) * (kMaxSplitFraction - kMinSplitFraction);
    const double first = order.quantity * fraction;
    fills.push_back(makeFill(first));
    fills.push_back(makeFill(order.quantity - first));
  } else {
    fills.push_back(makeFill(order.quantity));
  }
  return fills;
}

double SimulatedVenue::fillPrice(const domain::Order& order) {
  double slippage = 0.0;
  if (unit_(rng_) < params_.shock_slippage_probability) {
    slippage = (unit_(rng_) - 0.5) * params_.shock_slippage_max;
  } else {
    slippage = domain::signedQuantity(order.side,
                                      order.quantity * params_.impact_per_unit);
  }
  return std::max(order.price * (1.0 + slippage),
                  order.price * kMinPriceFraction);
}

}  // namespace hft
