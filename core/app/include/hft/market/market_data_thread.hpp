#pragma once

#include "hft/concurrent/bounded_channel.hpp"
#include "hft/domain/quote.hpp"
#include "hft/market/i_quote_source.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace hft {

// -----------------------------------------------------------------------------
// MarketDataThread — dedicated producer thread for one quote source
// -----------------------------------------------------------------------------
//
// @brief  Runs an IQuoteSource on its own std::thread and pushes every quote
//         into the pipeline's bounded quote channel.
//
// @details
// push() blocks while the channel is full, so a slow pipeline slows the
// source down instead of losing quotes. When the source's run() returns,
// for whatever reason, the thread closes the quote channel. That close is
// the pipeline's one and only shutdown signal.
//
// stop() only asks the source to stop. It does not close the channel
// directly, so quotes already produced are still delivered in order.
//
// Thread model:
//   start()/stop()/join() from the owning thread (InstrumentEngine).
//
// Ownership:
//   Owns the IQuoteSource via std::unique_ptr. Holds a reference to the
//   quote channel, owned by InstrumentEngine, which must outlive this object.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  MarketDataThread(std::string symbol,
                   std::unique_ptr<IQuoteSource> source,
                   BoundedChannel<domain::Quote>& quotes);

  // RAII: stops the source and joins the thread.
  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // Idempotent.
  void start();

  // Asks the source to stop. Non-blocking; call join() to wait.
  void stop();

  void join();

  std::uint64_t published() const { return published_.load(); }

 private:
  const std::string symbol_;
  std::unique_ptr<IQuoteSource> source_;
  BoundedChannel<domain::Quote>& quotes_;

  std::atomic<std::uint64_t> published_{0};
  std::thread thread_;
};

}  // namespace hft
