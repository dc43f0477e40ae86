#pragma once

#include "hft/config/pipeline_config.hpp"
#include "hft/market/i_quote_source.hpp"
#include "hft/market/synthetic_quote_generator.hpp"

#include <atomic>
#include <cstdint>

namespace hft {

// -----------------------------------------------------------------------------
// SyntheticQuoteSource — paced SyntheticQuoteGenerator
// -----------------------------------------------------------------------------
//
// @brief  Emits one generated quote per tick_interval_ms.
//
// @details
// Clock modes:
//   Live      — sleeps one tick interval before each quote and stamps it with
//               the wall clock.
//   Simulated — never sleeps; the n-th quote (0-based) is stamped
//               start_ms + n * tick_interval_ms. Bounded runs finish as fast
//               as the pipeline can consume them and always produce the same
//               timestamps.
//
// max_ticks bounds the run (0 = until stop()).
// -----------------------------------------------------------------------------
class SyntheticQuoteSource final : public IQuoteSource {
 public:
  // start_ms is only used in simulated mode.
  SyntheticQuoteSource(const PipelineConfig& config, std::int64_t start_ms = 0);

  SyntheticQuoteSource(const SyntheticQuoteSource&) = delete;
  SyntheticQuoteSource& operator=(const SyntheticQuoteSource&) = delete;

  void run(const QuoteSink& sink) override;
  void stop() override;

  std::uint64_t emitted() const { return emitted_.load(); }

 private:
  SyntheticQuoteGenerator generator_;
  const ClockMode clock_;
  const std::int64_t tick_interval_ms_;
  const std::uint64_t max_ticks_;
  const std::int64_t start_ms_;

  std::atomic<bool> running_{true};
  std::atomic<std::uint64_t> emitted_{0};
};

}  // namespace hft
