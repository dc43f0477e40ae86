// =============================================================================
// order_tracker_test.cpp
// =============================================================================
// Unit tests for hft::OrderTracker, the pipeline's record of orders that
// were admitted and still await fills.
// =============================================================================

#include "hft/risk/order_tracker.hpp"

#include <gtest/gtest.h>

namespace {

hft::domain::Order makeOrder(hft::domain::OrderId id, double qty) {
  hft::domain::Order o;
  o.id = id;
  o.symbol = "XYZ";
  o.side = hft::domain::Side::Buy;
  o.quantity = qty;
  o.price = 10.0;
  return o;
}

hft::domain::Fill makeFill(hft::domain::OrderId id, double qty) {
  hft::domain::Fill f;
  f.order_id = id;
  f.quantity = qty;
  f.price = 10.0;
  return f;
}

}  // namespace

TEST(OrderTrackerTest, SingleFillCompletesOrder) {
  hft::OrderTracker tracker;
  tracker.track(makeOrder(1, 100.0), 500);
  EXPECT_TRUE(tracker.isInFlight(1));

  auto outcome = tracker.onFill(makeFill(1, 100.0));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->completed);
  EXPECT_DOUBLE_EQ(outcome->remaining, 0.0);
  EXPECT_EQ(outcome->dispatched_us, 500);
  EXPECT_EQ(tracker.inFlight(), 0u);
}

TEST(OrderTrackerTest, PartialFillsCompleteDespiteRounding) {
  hft::OrderTracker tracker;
  tracker.track(makeOrder(7, 100.0), 0);

  const double first = 100.0 * 0.3;
  auto partial = tracker.onFill(makeFill(7, first));
  ASSERT_TRUE(partial.has_value());
  EXPECT_FALSE(partial->completed);
  EXPECT_NEAR(partial->remaining, 70.0, 1e-9);
  ASSERT_TRUE(tracker.remaining(7).has_value());

  auto last = tracker.onFill(makeFill(7, 100.0 - first));
  ASSERT_TRUE(last.has_value());
  EXPECT_TRUE(last->completed);
  EXPECT_FALSE(tracker.remaining(7).has_value());
}

TEST(OrderTrackerTest, UnknownFillIsReported) {
  hft::OrderTracker tracker;
  EXPECT_FALSE(tracker.onFill(makeFill(99, 1.0)).has_value());
}

TEST(OrderTrackerTest, EraseForgetsOrder) {
  hft::OrderTracker tracker;
  tracker.track(makeOrder(3, 1.0), 0);
  EXPECT_TRUE(tracker.erase(3));
  EXPECT_FALSE(tracker.erase(3));
  EXPECT_FALSE(tracker.onFill(makeFill(3, 1.0)).has_value());
}

TEST(OrderTrackerTest, AbandonAllReturnsOldestFirstWithRemaining) {
  hft::OrderTracker tracker;
  tracker.track(makeOrder(5, 1.0), 0);
  tracker.track(makeOrder(2, 4.0), 0);
  tracker.track(makeOrder(9, 1.0), 0);
  ASSERT_TRUE(tracker.onFill(makeFill(2, 1.5)).has_value());

  const auto abandoned = tracker.abandonAll();
  ASSERT_EQ(abandoned.size(), 3u);
  EXPECT_EQ(abandoned[0].order.id, 2u);
  EXPECT_DOUBLE_EQ(abandoned[0].remaining, 2.5);
  EXPECT_EQ(abandoned[1].order.id, 5u);
  EXPECT_DOUBLE_EQ(abandoned[1].remaining, 1.0);
  EXPECT_EQ(abandoned[2].order.id, 9u);
  EXPECT_EQ(tracker.inFlight(), 0u);
}

TEST(OrderTrackerTest, TakeRemovesOneOrder) {
  hft::OrderTracker tracker;
  tracker.track(makeOrder(4, 3.0), 0);
  tracker.track(makeOrder(6, 1.0), 0);
  ASSERT_TRUE(tracker.onFill(makeFill(4, 1.0)).has_value());

  const auto taken = tracker.take(4);
  ASSERT_TRUE(taken.has_value());
  EXPECT_EQ(taken->order.id, 4u);
  EXPECT_DOUBLE_EQ(taken->remaining, 2.0);
  EXPECT_FALSE(tracker.isInFlight(4));
  EXPECT_TRUE(tracker.isInFlight(6));
  EXPECT_FALSE(tracker.take(4).has_value());
}
