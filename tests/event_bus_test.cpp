// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for hft::EventBus carrying pipeline notifications.
//
// Validates:
//   - Generic subscription receives every event type
//   - Typed subscription receives only the matching type, with its data
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish from inside a callback does not deadlock
//
// All tests are single-threaded. Cross-thread delivery is covered by
// pipeline_test.cpp and instrument_engine_test.cpp.
// =============================================================================

#include "hft/eventbus/event_bus.hpp"
#include "hft/events/event.hpp"
#include "hft/events/pipeline_events.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  hft::EventBus bus;

  static hft::OrderAdmittedEvent makeAdmitted(std::uint64_t id, double qty) {
    hft::OrderAdmittedEvent e;
    e.symbol = "XYZ";
    e.order.id = id;
    e.order.symbol = "XYZ";
    e.order.side = hft::domain::Side::Buy;
    e.order.quantity = qty;
    e.order.price = 100.0;
    e.timestamp_ms = 5;
    return e;
  }

  static hft::CircuitBreakerEvent makeTrip(std::int64_t at) {
    hft::CircuitBreakerEvent e;
    e.symbol = "XYZ";
    e.reason = hft::TripReason::PriceShock;
    e.tripped_at_ms = at;
    e.expiry_ms = at + 60'000;
    return e;
  }
};

TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  std::vector<std::size_t> indices;
  bus.subscribe([&indices](const hft::Event& e) { indices.push_back(e.index()); });

  bus.publish(makeAdmitted(1, 10.0));
  bus.publish(makeTrip(100));

  ASSERT_EQ(indices.size(), 2u);
  EXPECT_EQ(indices[0], hft::Event(hft::OrderAdmittedEvent{}).index());
  EXPECT_EQ(indices[1], hft::Event(hft::CircuitBreakerEvent{}).index());
}

TEST_F(EventBusTest, TypedSubscriberFiltersAndReceivesData) {
  std::vector<hft::CircuitBreakerEvent> trips;
  bus.subscribe<hft::CircuitBreakerEvent>(
      [&trips](const hft::CircuitBreakerEvent& e) { trips.push_back(e); });

  bus.publish(makeAdmitted(1, 10.0));
  bus.publish(makeTrip(250));
  bus.publish(makeAdmitted(2, 20.0));

  ASSERT_EQ(trips.size(), 1u);
  EXPECT_EQ(trips[0].symbol, "XYZ");
  EXPECT_EQ(trips[0].reason, hft::TripReason::PriceShock);
  EXPECT_EQ(trips[0].tripped_at_ms, 250);
  EXPECT_EQ(trips[0].expiry_ms, 60'250);
}

TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int a = 0;
  int b = 0;
  bus.subscribe([&a](const hft::Event&) { ++a; });
  bus.subscribe<hft::OrderAdmittedEvent>(
      [&b](const hft::OrderAdmittedEvent&) { ++b; });
  EXPECT_EQ(bus.subscriberCount(), 2u);

  bus.publish(makeAdmitted(1, 1.0));

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int count = 0;
  auto id = bus.subscribe([&count](const hft::Event&) { ++count; });

  bus.publish(makeTrip(1));
  bus.unsubscribe(id);
  bus.publish(makeTrip(2));

  EXPECT_EQ(count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, UnsubscribeUnknownIdIsNoOp) {
  bus.subscribe([](const hft::Event&) {});
  bus.unsubscribe(12345);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_THROW(bus.publish(makeAdmitted(1, 1.0)));
}

// -----------------------------------------------------------------------------
// A subscriber reacting to a breaker trip by publishing again must not
// deadlock: publish() runs callbacks outside the lock.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int admitted_seen = 0;
  bus.subscribe<hft::OrderAdmittedEvent>(
      [&admitted_seen](const hft::OrderAdmittedEvent&) { ++admitted_seen; });
  bus.subscribe<hft::CircuitBreakerEvent>(
      [this](const hft::CircuitBreakerEvent&) {
        bus.publish(makeAdmitted(9, 1.0));
      });

  bus.publish(makeTrip(10));

  EXPECT_EQ(admitted_seen, 1);
}

TEST_F(EventBusTest, RejectedEventCarriesReason) {
  hft::AdmissionDecision seen = hft::AdmissionDecision::Accepted;
  bus.subscribe<hft::OrderRejectedEvent>(
      [&seen](const hft::OrderRejectedEvent& e) { seen = e.reason; });

  hft::OrderRejectedEvent e;
  e.symbol = "XYZ";
  e.reason = hft::AdmissionDecision::RateLimit;
  bus.publish(e);

  EXPECT_EQ(seen, hft::AdmissionDecision::RateLimit);
  EXPECT_STREQ(hft::toString(seen), "RateLimit");
}
