#include "hft/engine/instrument_engine.hpp"
#include "hft/execution/simulated_venue.hpp"
#include "hft/market/synthetic_quote_source.hpp"
#include "hft/market/zmq_quote_gateway.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace hft {

namespace {

std::unique_ptr<IQuoteSource> makeQuoteSource(const PipelineConfig& config) {
  switch (config.source) {
    case SourceKind::Synthetic:
      return std::make_unique<SyntheticQuoteSource>(config);
    case SourceKind::Zmq:
      return std::make_unique<ZmqQuoteGateway>(config.md_endpoint,
                                               config.symbol);
  }
  throw ConfigError("[" + config.symbol + "] unsupported quote source");
}

const PipelineConfig& validated(const PipelineConfig& config) {
  config.validate();
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
InstrumentEngine::InstrumentEngine(PipelineConfig config)
    : InstrumentEngine(config, makeQuoteSource(validated(config)), nullptr) {}

InstrumentEngine::InstrumentEngine(PipelineConfig config,
                                   std::unique_ptr<IQuoteSource> source,
                                   std::unique_ptr<IExecutionVenue> venue)
    : symbol_(validated(config).symbol),
      quotes_(config.quote_channel_capacity, &readiness_),
      fills_(config.fill_channel_capacity, &readiness_),
      monitor_(config.symbol) {
  pipeline_ = std::make_unique<Pipeline>(
      config,
      [this](const domain::Order& order) {
        return venue_thread_->submit(order);
      },
      &monitor_);

  if (!venue) {
    venue = std::make_unique<SimulatedVenue>(config.venue, pipeline_->clock());
  }
  venue_thread_ =
      std::make_unique<VenueThread>(symbol_, std::move(venue), fills_);
  market_data_thread_ =
      std::make_unique<MarketDataThread>(symbol_, std::move(source), quotes_);
}

InstrumentEngine::~InstrumentEngine() {
  stop();
  wait();
}

// -----------------------------------------------------------------------------
// start(): consumers first, producer last
// -----------------------------------------------------------------------------
void InstrumentEngine::start() {
  if (pipeline_thread_.joinable()) {
    return;
  }

  venue_thread_->start();
  pipeline_thread_ = std::thread([this] { runPipeline(); });
  market_data_thread_->start();

  std::cout << "[InstrumentEngine] " << symbol_
            << " started. Threads: market_data, pipeline, venue.\n";
}

void InstrumentEngine::stop() { market_data_thread_->stop(); }

void InstrumentEngine::wait() {
  if (pipeline_thread_.joinable()) {
    pipeline_thread_.join();
  }
  market_data_thread_->join();
  venue_thread_->join();
}

// -----------------------------------------------------------------------------
// runPipeline(): pipeline thread body
// -----------------------------------------------------------------------------
void InstrumentEngine::runPipeline() {
  try {
    pipeline_->run(quotes_, fills_, readiness_);
  } catch (const std::exception& e) {
    // Unblock the producer so the market data thread can exit, then fall
    // through to the normal venue shutdown.
    std::cerr << "[InstrumentEngine] " << symbol_
              << " ERROR: pipeline terminated: " << e.what() << "\n";
    market_data_thread_->stop();
    quotes_.close();
  }

  // Nothing reads fills any more; a venue blocked on a full channel must
  // not outlive the pipeline.
  fills_.close();
  venue_thread_->shutdown();
  finished_.store(true);
  std::cout << "[InstrumentEngine] " << symbol_ << " pipeline finished.\n";
}

}  // namespace hft
