// =============================================================================
// market_making_strategy_test.cpp
// =============================================================================
// Unit tests for hft::MarketMakingStrategy.
//
// Validates:
//   - Side alternation while inventory sits inside the band (Buy first)
//   - Inventory-driven side selection and mid skew
//   - Volatility widening of the spread, tick rounding
//   - Size reduction for exposure-increasing orders and headroom clipping
// =============================================================================

#include "hft/concurrent/order_id_generator.hpp"
#include "hft/strategy/market_making_strategy.hpp"

#include <gtest/gtest.h>

#include <cmath>

namespace {

hft::domain::Quote quoteAt(double bid, double ask, std::int64_t ts = 0) {
  hft::domain::Quote q;
  q.bid = bid;
  q.ask = ask;
  q.timestamp_ms = ts;
  return q;
}

hft::domain::Fill fill(hft::domain::Side side, double qty, double px) {
  hft::domain::Fill f;
  f.order_id = 1;
  f.side = side;
  f.quantity = qty;
  f.price = px;
  return f;
}

bool onTick(double price, double tick) {
  const double ticks = price / tick;
  return std::abs(ticks - std::round(ticks)) < 1e-6;
}

}  // namespace

class MarketMakingStrategyTest : public ::testing::Test {
 protected:
  MarketMakingStrategyTest() {
    config.symbol = "XYZ";
    config.tick_size = 0.01;
    config.max_position = 10'000.0;
  }

  hft::PipelineConfig config;
  hft::OrderIdGenerator ids;
};

TEST_F(MarketMakingStrategyTest, SpreadsDeriveFromTickSize) {
  hft::MarketMakingStrategy mm(config, ids);
  EXPECT_DOUBLE_EQ(mm.baseSpread(), 0.02);
  EXPECT_DOUBLE_EQ(mm.minSpread(), 0.01);
  EXPECT_STREQ(mm.name(), "market_making");
}

// -----------------------------------------------------------------------------
// 1. Flat book: Buy one tick under mid, then Sell one tick over, alternating.
// -----------------------------------------------------------------------------
TEST_F(MarketMakingStrategyTest, AlternatesSidesWhenFlat) {
  hft::MarketMakingStrategy mm(config, ids);

  auto first = mm.onQuote(quoteAt(99.99, 100.01));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->side, hft::domain::Side::Buy);
  EXPECT_NEAR(first->price, 99.99, 1e-9);
  EXPECT_DOUBLE_EQ(first->quantity, 100.0);
  EXPECT_EQ(first->symbol, "XYZ");
  EXPECT_EQ(first->id, 1u);

  auto second = mm.onQuote(quoteAt(99.99, 100.01));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->side, hft::domain::Side::Sell);
  EXPECT_NEAR(second->price, 100.01, 1e-9);
  EXPECT_EQ(second->id, 2u);

  auto third = mm.onQuote(quoteAt(99.99, 100.01));
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->side, hft::domain::Side::Buy);
  EXPECT_EQ(mm.quotesReceived(), 3u);
}

// -----------------------------------------------------------------------------
// 2. Long inventory: quote the reducing side with the mid skewed down.
// -----------------------------------------------------------------------------
TEST_F(MarketMakingStrategyTest, LongInventorySellsBelowMid) {
  hft::MarketMakingStrategy mm(config, ids);
  mm.onFill(fill(hft::domain::Side::Buy, 5'000.0, 100.0));

  // skewed mid = 100 - 0.5 * 2 * 0.02 = 99.98; ask side = 99.98 + 0.01
  auto order = mm.onQuote(quoteAt(99.99, 100.01));
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->side, hft::domain::Side::Sell);
  EXPECT_NEAR(order->price, 99.99, 1e-9);
  EXPECT_DOUBLE_EQ(order->quantity, 100.0);

  // Still long: keeps selling rather than alternating.
  auto again = mm.onQuote(quoteAt(99.99, 100.01));
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->side, hft::domain::Side::Sell);
}

TEST_F(MarketMakingStrategyTest, ShortInventoryBuysAboveMid) {
  hft::MarketMakingStrategy mm(config, ids);
  mm.onFill(fill(hft::domain::Side::Sell, 5'000.0, 100.0));

  auto order = mm.onQuote(quoteAt(99.99, 100.01));
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->side, hft::domain::Side::Buy);
  EXPECT_NEAR(order->price, 100.01, 1e-9);
  EXPECT_DOUBLE_EQ(mm.position().net_quantity, -5'000.0);
}

TEST_F(MarketMakingStrategyTest, VolatilityWidensSpread) {
  config.market_making.volatility_sensitivity = 100.0;
  hft::MarketMakingStrategy mm(config, ids);

  mm.onQuote(quoteAt(89.99, 90.01));    // Buy
  mm.onQuote(quoteAt(109.99, 110.01));  // Sell
  EXPECT_NEAR(mm.volatility(), 0.1, 1e-9);

  // mids {90, 110, 100}: vol = sqrt(200/3) / 100
  auto order = mm.onQuote(quoteAt(99.99, 100.01));
  ASSERT_TRUE(order.has_value());
  const double vol = std::sqrt(200.0 / 3.0) / 100.0;
  const double half = 0.02 * (1.0 + 100.0 * vol) / 2.0;
  EXPECT_EQ(order->side, hft::domain::Side::Buy);
  EXPECT_NEAR(order->price, std::round((100.0 - half) / 0.01) * 0.01, 1e-9);
  EXPECT_TRUE(onTick(order->price, config.tick_size));
  EXPECT_LT(order->price, 99.95);
}

TEST_F(MarketMakingStrategyTest, VolatilityWindowIsRolling) {
  config.market_making.volatility_window = 2;
  hft::MarketMakingStrategy mm(config, ids);

  mm.onQuote(quoteAt(89.99, 90.01));
  mm.onQuote(quoteAt(109.99, 110.01));
  EXPECT_GT(mm.volatility(), 0.0);

  mm.onQuote(quoteAt(109.99, 110.01));
  EXPECT_DOUBLE_EQ(mm.volatility(), 0.0);
}

// -----------------------------------------------------------------------------
// 3. Inside the band the strategy alternates, but the side that grows the
// deviation is sized down by |normalized| / 2.
// -----------------------------------------------------------------------------
TEST_F(MarketMakingStrategyTest, ExposureIncreasingOrdersAreSmaller) {
  config.market_making.inventory_band = 1'000.0;
  hft::MarketMakingStrategy mm(config, ids);
  mm.onFill(fill(hft::domain::Side::Buy, 500.0, 100.0));

  auto buy = mm.onQuote(quoteAt(99.99, 100.01));
  ASSERT_TRUE(buy.has_value());
  EXPECT_EQ(buy->side, hft::domain::Side::Buy);
  EXPECT_NEAR(buy->quantity, 100.0 * (1.0 - 0.05 * 0.5), 1e-9);

  auto sell = mm.onQuote(quoteAt(99.99, 100.01));
  ASSERT_TRUE(sell.has_value());
  EXPECT_EQ(sell->side, hft::domain::Side::Sell);
  EXPECT_DOUBLE_EQ(sell->quantity, 100.0);
}

TEST_F(MarketMakingStrategyTest, SizeClippedToHeadroom) {
  config.max_position = 150.0;
  config.market_making.inventory_band = 1'000.0;
  hft::MarketMakingStrategy mm(config, ids);
  mm.onFill(fill(hft::domain::Side::Buy, 100.0, 100.0));

  auto buy = mm.onQuote(quoteAt(99.99, 100.01));
  ASSERT_TRUE(buy.has_value());
  EXPECT_EQ(buy->side, hft::domain::Side::Buy);
  EXPECT_DOUBLE_EQ(buy->quantity, 50.0);
}

TEST_F(MarketMakingStrategyTest, NoOrderWithoutHeadroom) {
  config.max_position = 100.0;
  config.market_making.inventory_band = 1'000.0;
  hft::MarketMakingStrategy mm(config, ids);
  mm.onFill(fill(hft::domain::Side::Buy, 100.0, 100.0));

  // Buy first in the alternation, but the position is already at the limit.
  EXPECT_FALSE(mm.onQuote(quoteAt(99.99, 100.01)).has_value());
}

TEST_F(MarketMakingStrategyTest, FillsFeedPnl) {
  hft::MarketMakingStrategy mm(config, ids);
  mm.onFill(fill(hft::domain::Side::Buy, 10.0, 100.0));
  mm.onFill(fill(hft::domain::Side::Sell, 10.0, 100.5));
  EXPECT_NEAR(mm.pnl(), 5.0, 1e-9);
  EXPECT_EQ(mm.tradeCount(), 2u);
}
