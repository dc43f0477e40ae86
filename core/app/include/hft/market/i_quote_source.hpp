#pragma once

#include "hft/domain/quote.hpp"

#include <functional>

namespace hft {

// -----------------------------------------------------------------------------
// IQuoteSource — abstract market event source
// -----------------------------------------------------------------------------
//
// @brief  A lazy, time-paced sequence of quotes for one instrument.
//
// @details
// run() blocks and hands each quote to the sink, in production order. It
// returns when:
//   - stop() was called (from any thread),
//   - the sink returned false (the downstream channel is closed), or
//   - the source is exhausted (a bounded synthetic run).
//
// A source is not restartable: once run() has returned it must not be run
// again.
//
// Implementations: SyntheticQuoteSource, ZmqQuoteGateway.
//
// Thread model: run() on one dedicated thread (MarketDataThread); stop()
// from any thread.
// -----------------------------------------------------------------------------
class IQuoteSource {
 public:
  // Returns false when the quote could not be delivered and the source
  // should stop producing.
  using QuoteSink = std::function<bool(const domain::Quote&)>;

  virtual ~IQuoteSource() = default;

  virtual void run(const QuoteSink& sink) = 0;
  virtual void stop() = 0;
};

}  // namespace hft
