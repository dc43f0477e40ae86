// =============================================================================
// synthetic_quote_source_test.cpp
// =============================================================================
// Unit tests for hft::SyntheticQuoteGenerator and hft::SyntheticQuoteSource.
//
// Validates:
//   - Every generated quote is valid (0 < bid < ask)
//   - A fixed seed reproduces the same stream
//   - Simulated-clock stamping, max_ticks bound, stop(), sink refusal
// =============================================================================

#include "hft/market/synthetic_quote_generator.hpp"
#include "hft/market/synthetic_quote_source.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

TEST(SyntheticQuoteGeneratorTest, QuotesAreValid) {
  hft::SyntheticSourceParams params;
  params.jump_probability = 0.05;
  hft::SyntheticQuoteGenerator gen(params, 0.01, 7);

  for (int i = 0; i < 10'000; ++i) {
    const auto q = gen.next(i);
    ASSERT_TRUE(q.isValid()) << "tick " << i << " bid=" << q.bid
                             << " ask=" << q.ask;
    ASSERT_GT(q.bid, 0.0);
    EXPECT_EQ(q.timestamp_ms, i);
  }
  EXPECT_EQ(gen.ticks(), 10'000u);
  EXPECT_GE(gen.volatility(), params.volatility_min);
  EXPECT_LE(gen.volatility(), params.volatility_max);
}

TEST(SyntheticQuoteGeneratorTest, SameSeedSameStream) {
  hft::SyntheticSourceParams params;
  hft::SyntheticQuoteGenerator a(params, 0.01, 42);
  hft::SyntheticQuoteGenerator b(params, 0.01, 42);
  hft::SyntheticQuoteGenerator c(params, 0.01, 43);

  bool any_difference = false;
  for (int i = 0; i < 1'000; ++i) {
    const auto qa = a.next(i);
    const auto qb = b.next(i);
    const auto qc = c.next(i);
    ASSERT_DOUBLE_EQ(qa.bid, qb.bid);
    ASSERT_DOUBLE_EQ(qa.ask, qb.ask);
    any_difference = any_difference || qa.bid != qc.bid;
  }
  EXPECT_TRUE(any_difference);
}

TEST(SyntheticQuoteGeneratorTest, SpreadWidensWithVolatility) {
  hft::SyntheticSourceParams params;
  params.volatility_min = 0.05;
  params.volatility_max = 0.05;
  hft::SyntheticQuoteGenerator gen(params, 0.01, 1);

  const auto q = gen.next(0);
  // tick * (1 + vol * 100) = 0.01 * 6
  EXPECT_NEAR(q.spread(), 0.06, 1e-9);
}

// -----------------------------------------------------------------------------
// Simulated clock: the n-th quote is stamped start + n * tick_interval and the
// source returns after max_ticks without sleeping.
// -----------------------------------------------------------------------------
TEST(SyntheticQuoteSourceTest, SimulatedStampsAndMaxTicks) {
  hft::PipelineConfig config;
  config.clock = hft::ClockMode::Simulated;
  config.seed = 5;
  config.max_ticks = 50;
  config.tick_interval_ms = 3;

  hft::SyntheticQuoteSource source(config, 1'000);
  std::vector<hft::domain::Quote> quotes;
  source.run([&quotes](const hft::domain::Quote& q) {
    quotes.push_back(q);
    return true;
  });

  ASSERT_EQ(quotes.size(), 50u);
  EXPECT_EQ(source.emitted(), 50u);
  for (std::size_t i = 0; i < quotes.size(); ++i) {
    EXPECT_EQ(quotes[i].timestamp_ms, 1'000 + static_cast<std::int64_t>(i) * 3);
  }
}

TEST(SyntheticQuoteSourceTest, SinkRefusalEndsRun) {
  hft::PipelineConfig config;
  config.clock = hft::ClockMode::Simulated;
  config.seed = 5;

  hft::SyntheticQuoteSource source(config);
  int delivered = 0;
  source.run([&delivered](const hft::domain::Quote&) {
    return ++delivered < 10;
  });

  EXPECT_EQ(delivered, 10);
  EXPECT_EQ(source.emitted(), 9u);
}

TEST(SyntheticQuoteSourceTest, StopEndsLiveRun) {
  hft::PipelineConfig config;
  config.clock = hft::ClockMode::Live;
  config.tick_interval_ms = 1;
  config.seed = 5;

  hft::SyntheticQuoteSource source(config);
  std::atomic<int> delivered{0};
  std::thread runner([&] {
    source.run([&delivered](const hft::domain::Quote& q) {
      delivered.fetch_add(1);
      return q.isValid();
    });
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  source.stop();
  runner.join();

  EXPECT_GT(delivered.load(), 0);
}
