#include "hft/market/synthetic_quote_source.hpp"
#include "hft/time/time_utils.hpp"

#include <chrono>
#include <thread>

namespace hft {

SyntheticQuoteSource::SyntheticQuoteSource(const PipelineConfig& config,
                                           std::int64_t start_ms)
    : generator_(config.synthetic, config.tick_size, config.seed),
      clock_(config.clock),
      tick_interval_ms_(config.tick_interval_ms),
      max_ticks_(config.max_ticks),
      start_ms_(start_ms) {}

// -----------------------------------------------------------------------------
// run(): emit until stopped, exhausted, or the sink refuses a quote
// -----------------------------------------------------------------------------
void SyntheticQuoteSource::run(const QuoteSink& sink) {
  std::uint64_t n = 0;

  while (running_.load() && (max_ticks_ == 0 || n < max_ticks_)) {
    std::int64_t timestamp_ms = 0;
    if (clock_ == ClockMode::Live) {
      std::this_thread::sleep_for(std::chrono::milliseconds(tick_interval_ms_));
      if (!running_.load()) {
        break;
      }
      timestamp_ms = wall_now_ms();
    } else {
      timestamp_ms = start_ms_ + static_cast<std::int64_t>(n) * tick_interval_ms_;
    }

    if (!sink(generator_.next(timestamp_ms))) {
      break;
    }
    ++n;
    emitted_.store(n);
  }
}

void SyntheticQuoteSource::stop() { running_.store(false); }

}  // namespace hft
