#pragma once

#include "hft/concurrent/bounded_channel.hpp"
#include "hft/config/pipeline_config.hpp"
#include "hft/domain/fill.hpp"
#include "hft/domain/quote.hpp"
#include "hft/engine/pipeline.hpp"
#include "hft/execution/i_execution_venue.hpp"
#include "hft/execution/venue_thread.hpp"
#include "hft/market/i_quote_source.hpp"
#include "hft/market/market_data_thread.hpp"
#include "hft/monitoring/performance_monitor.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace hft {

// -----------------------------------------------------------------------------
// InstrumentEngine — one instrument's pipeline and its threads
// -----------------------------------------------------------------------------
//
// @brief  Builds and wires every component that trades one instrument, and
//         owns their lifecycle.
//
// @details
// Thread layout (per instrument):
//
//   market data thread          pipeline thread            venue thread
//   ──────────────────          ───────────────            ────────────
//   IQuoteSource::run()
//        │ push (blocks when full)
//        ▼
//   quote channel ─────────▶ Pipeline::run() ──submit()──▶ order queue
//                                 ▲                            │
//                                 │                   IExecutionVenue
//                                 │                            │
//                            fill channel ◀──push (blocks)─────┘
//
// Construction validates the configuration and builds everything but
// starts nothing: a ConfigError (or a zmq::error_t from the gateway)
// leaves no thread running.
//
// Shutdown:
//   stop() asks the quote source to stop. The market data thread then
//   closes the quote channel, the pipeline drains the remaining quotes and
//   in-flight orders, and its thread closes the venue's order queue on the
//   way out. wait() joins all three threads. A source that exhausts itself
//   (max_ticks) triggers the same sequence without stop().
//
// Thread model:
//   Constructor, start(), stop(), wait() and the destructor from one
//   owning thread (main). stop() is also safe from a signal-watcher thread.
//
// Ownership:
//   Owns the channels, the monitor, the pipeline, the venue thread and the
//   market data thread.
// -----------------------------------------------------------------------------
class InstrumentEngine {
 public:
  // Builds the source and venue named by the config.
  // @throws ConfigError, zmq::error_t
  explicit InstrumentEngine(PipelineConfig config);

  // Uses the supplied source and venue instead (tests, custom adapters).
  InstrumentEngine(PipelineConfig config,
                   std::unique_ptr<IQuoteSource> source,
                   std::unique_ptr<IExecutionVenue> venue);

  // RAII: stop() and wait().
  ~InstrumentEngine();

  InstrumentEngine(const InstrumentEngine&) = delete;
  InstrumentEngine& operator=(const InstrumentEngine&) = delete;
  InstrumentEngine(InstrumentEngine&&) = delete;
  InstrumentEngine& operator=(InstrumentEngine&&) = delete;

  // Spawns the venue, pipeline and market data threads. Idempotent.
  void start();

  // Non-blocking shutdown request; in-flight orders still drain.
  void stop();

  // Blocks until every thread has exited.
  void wait();

  // True once the pipeline thread has left its event loop.
  bool finished() const { return finished_.load(); }

  const std::string& symbol() const { return symbol_; }
  Pipeline& pipeline() { return *pipeline_; }
  const Pipeline& pipeline() const { return *pipeline_; }
  EventBus& eventBus() { return pipeline_->eventBus(); }
  const PerformanceMonitor& monitor() const { return monitor_; }

 private:
  void runPipeline();

  const std::string symbol_;

  ReadinessSignal readiness_;
  BoundedChannel<domain::Quote> quotes_;
  BoundedChannel<domain::Fill> fills_;

  PerformanceMonitor monitor_;
  std::unique_ptr<Pipeline> pipeline_;
  std::unique_ptr<VenueThread> venue_thread_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  std::thread pipeline_thread_;
  std::atomic<bool> finished_{false};
};

}  // namespace hft
