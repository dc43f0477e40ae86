// =============================================================================
// zmq_quote_gateway_test.cpp
// =============================================================================
// Unit tests for hft::ZmqQuoteGateway.
//
// decode() is exercised directly; one test runs the recv loop against a real
// in-process PUB socket.
// =============================================================================

#include "hft/market/zmq_quote_gateway.hpp"

#include <gtest/gtest.h>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace {
const std::string kEndpoint = "tcp://127.0.0.1:57311";
}  // namespace

TEST(ZmqQuoteGatewayTest, DecodesQuote) {
  hft::ZmqQuoteGateway gateway(kEndpoint, "XYZ");

  auto quote = gateway.decode(
      R"({"symbol":"XYZ","bid":99.5,"ask":100.5,"timestamp_ms":1700})");
  ASSERT_TRUE(quote.has_value());
  EXPECT_DOUBLE_EQ(quote->bid, 99.5);
  EXPECT_DOUBLE_EQ(quote->ask, 100.5);
  EXPECT_EQ(quote->timestamp_ms, 1700);
  EXPECT_EQ(gateway.skipped(), 0u);
}

TEST(ZmqQuoteGatewayTest, FiltersOtherSymbols) {
  hft::ZmqQuoteGateway gateway(kEndpoint, "XYZ");
  EXPECT_FALSE(gateway
                   .decode(R"({"symbol":"ABC","bid":1,"ask":2,"timestamp_ms":1})")
                   .has_value());
  EXPECT_EQ(gateway.skipped(), 0u);

  // No symbol field: accepted.
  EXPECT_TRUE(
      gateway.decode(R"({"bid":1,"ask":2,"timestamp_ms":1})").has_value());
}

TEST(ZmqQuoteGatewayTest, SkipsMalformedAndCrossed) {
  hft::ZmqQuoteGateway gateway(kEndpoint, "");
  EXPECT_FALSE(gateway.decode("not json").has_value());
  EXPECT_FALSE(gateway.decode(R"({"bid":1,"timestamp_ms":1})").has_value());
  EXPECT_FALSE(gateway.decode(R"({"bid":"x","ask":2,"timestamp_ms":1})")
                   .has_value());
  EXPECT_FALSE(
      gateway.decode(R"({"bid":2,"ask":1,"timestamp_ms":1})").has_value());
  EXPECT_EQ(gateway.skipped(), 4u);
}

TEST(ZmqQuoteGatewayTest, ReceivesFromPublisher) {
  zmq::context_t ctx(1);
  zmq::socket_t pub(ctx, zmq::socket_type::pub);
  pub.bind(kEndpoint);

  hft::ZmqQuoteGateway gateway(kEndpoint, "XYZ");
  std::vector<hft::domain::Quote> received;
  std::atomic<std::size_t> count{0};
  std::thread runner([&] {
    gateway.run([&](const hft::domain::Quote& q) {
      received.push_back(q);
      return count.fetch_add(1) + 1 < 3;
    });
  });

  // PUB/SUB drops messages until the subscription propagates; keep sending
  // until the gateway has taken three.
  const std::string payload =
      R"({"symbol":"XYZ","bid":10.0,"ask":10.1,"timestamp_ms":5})";
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (count.load() < 3 && std::chrono::steady_clock::now() < deadline) {
    zmq::message_t msg(payload.data(), payload.size());
    (void)pub.send(msg, zmq::send_flags::dontwait);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  gateway.stop();
  runner.join();

  ASSERT_EQ(received.size(), 3u);
  EXPECT_DOUBLE_EQ(received[0].bid, 10.0);
  EXPECT_EQ(received[0].timestamp_ms, 5);
}
