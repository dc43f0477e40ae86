// -----------------------------------------------------------------------------
// hft_pipeline — single executable entry point.
//
//   1) Load the EngineConfig from argv[1], or use the built-in default
//      (one synthetic market-making instrument on a live clock).
//   2) Build one InstrumentEngine per configured instrument. Construction
//      validates everything; a ConfigError exits non-zero before any thread
//      starts.
//   3) Subscribe a logging callback for circuit breaker trips.
//   4) Start the MetricsReporter (log line and/or ZeroMQ PUB snapshot).
//   5) Start every engine and wait. A simulated instrument with max_ticks
//      finishes on its own; otherwise Ctrl-C requests shutdown.
//   6) Stop the reporter (final flush) and exit.
//
// Thread layout (per instrument):
//   market data thread → IQuoteSource::run()
//   pipeline thread    → Pipeline::run() (risk gate + strategy)
//   venue thread       → IExecutionVenue::execute()
// plus one metrics thread and the main thread, which only watches for
// SIGINT and completion.
// -----------------------------------------------------------------------------

#include "hft/config/config_loader.hpp"
#include "hft/engine/instrument_engine.hpp"
#include "hft/events/pipeline_events.hpp"
#include "hft/monitoring/log_metrics_sink.hpp"
#include "hft/monitoring/metrics_reporter.hpp"
#include "hft/monitoring/zmq_metrics_publisher.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {

// Set by the SIGINT handler, polled by main(). A lock-free atomic store is
// async-signal-safe; anything that touches the engines happens on main.
std::atomic<bool> g_stop_requested{false};

void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

bool allFinished(const std::vector<std::unique_ptr<hft::InstrumentEngine>>& engines) {
  for (const auto& engine : engines) {
    if (!engine->finished()) {
      return false;
    }
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  hft::EngineConfig config;
  std::vector<std::unique_ptr<hft::InstrumentEngine>> engines;
  std::unique_ptr<hft::MetricsReporter> reporter;

  try {
    config = argc > 1 ? hft::loadEngineConfig(argv[1])
                      : hft::defaultEngineConfig();

    // -----------------------------------------------------------------------
    // 2) Engines. Each owns its channels, pipeline and threads.
    // -----------------------------------------------------------------------
    for (const auto& instrument : config.instruments) {
      engines.push_back(std::make_unique<hft::InstrumentEngine>(instrument));
      std::cout << "[main] " << instrument.symbol << ": strategy="
                << hft::toString(instrument.strategy)
                << " clock=" << hft::toString(instrument.clock)
                << " source=" << hft::toString(instrument.source) << "\n";
    }

    // -----------------------------------------------------------------------
    // 4) Telemetry.
    // -----------------------------------------------------------------------
    reporter = std::make_unique<hft::MetricsReporter>(
        std::chrono::milliseconds(config.telemetry.interval_ms));
    if (config.telemetry.log) {
      reporter->addSink(std::make_unique<hft::LogMetricsSink>());
    }
    if (!config.telemetry.pub_endpoint.empty()) {
      reporter->addSink(std::make_unique<hft::ZmqMetricsPublisher>(
          config.telemetry.pub_endpoint));
    }
  } catch (const hft::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ZeroMQ setup failed: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Breaker trips are rare and always worth a line. Callbacks run on the
  // pipeline thread of the instrument that tripped.
  // -------------------------------------------------------------------------
  for (auto& engine : engines) {
    engine->eventBus().subscribe<hft::CircuitBreakerEvent>(
        [](const hft::CircuitBreakerEvent& e) {
          std::cout << "[main] circuit breaker " << e.symbol
                    << " reason=" << hft::toString(e.reason)
                    << " tripped_at=" << e.tripped_at_ms
                    << " expiry=" << e.expiry_ms << "\n";
        });
    reporter->addMonitor(engine->monitor());
  }

  // -------------------------------------------------------------------------
  // 5) Run.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);

  reporter->start();
  for (auto& engine : engines) {
    engine->start();
  }
  std::cout << "[main] " << engines.size()
            << " instrument(s) running. Press Ctrl-C to shut down.\n";

  bool stop_sent = false;
  while (!allFinished(engines)) {
    if (!stop_sent && g_stop_requested.load()) {
      std::cout << "\n[main] SIGINT received. Shutting down...\n";
      for (auto& engine : engines) {
        engine->stop();
      }
      stop_sent = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  for (auto& engine : engines) {
    engine->wait();
  }

  // -------------------------------------------------------------------------
  // 6) Final snapshot, then the engines are destroyed (threads already
  // joined).
  // -------------------------------------------------------------------------
  reporter->stop();

  for (const auto& engine : engines) {
    const auto& pipeline = engine->pipeline();
    std::cout << "[main] " << engine->symbol()
              << " quotes=" << pipeline.quotesHandled()
              << " admitted=" << pipeline.ordersAdmitted()
              << " rejected=" << pipeline.ordersRejected()
              << " fills=" << pipeline.fillsApplied()
              << " abandoned=" << pipeline.abandonedOrders()
              << " venue_rejects=" << pipeline.venueRejects()
              << " pnl=" << pipeline.riskGate().cumulativePnl() << "\n";
  }

  std::cout << "[main] Shutdown complete.\n";
  return 0;
}
