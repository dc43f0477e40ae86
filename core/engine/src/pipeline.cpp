#include "hft/engine/pipeline.hpp"
#include "hft/strategy/strategy_factory.hpp"
#include "hft/time/live_time_provider.hpp"
#include "hft/time/time_utils.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace hft {

namespace {

// Upper bound on one idle wait in run(); keeps the drain timeout responsive.
constexpr std::chrono::milliseconds kIdleWait{10};

std::int64_t steady_now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

// Validates before any member that depends on the values is built.
const PipelineConfig& validated(const PipelineConfig& config) {
  config.validate();
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
Pipeline::Pipeline(PipelineConfig config,
                   OrderSink order_sink,
                   PerformanceMonitor* monitor)
    : config_(validated(config)),
      clock_(config_.clock == ClockMode::Simulated
                 ? std::unique_ptr<ITimeProvider>(
                       std::make_unique<SimulationTimeProvider>())
                 : std::unique_ptr<ITimeProvider>(
                       std::make_unique<LiveTimeProvider>())),
      sim_clock_(dynamic_cast<SimulationTimeProvider*>(clock_.get())),
      strategy_(makeStrategy(config_, id_gen_)),
      gate_(config_, *clock_),
      order_sink_(std::move(order_sink)),
      monitor_(monitor) {
  std::cout << "[Pipeline] " << config_.symbol << " ready: strategy="
            << strategy_->name() << " clock=" << toString(config_.clock)
            << " pnl=" << toString(config_.pnl_method) << "\n";
}

// -----------------------------------------------------------------------------
// handleQuote()
// -----------------------------------------------------------------------------
std::optional<AdmissionDecision> Pipeline::handleQuote(
    const domain::Quote& quote) {
  const std::int64_t received_us = steady_now_us();
  ++quotes_handled_;
  if (monitor_) {
    monitor_->recordQuote();
  }

  if (sim_clock_ != nullptr) {
    sim_clock_->advance_time(quote.timestamp_ms);
  }

  if (gate_.onQuote(quote)) {
    onBreakerTripped();
  }

  auto order = strategy_->onQuote(quote);
  if (!order) {
    if (monitor_) {
      monitor_->recordLatency(steady_now_us() - received_us);
    }
    return std::nullopt;
  }

  AdmissionDecision decision = gate_.check(*order);
  const std::int64_t now_ms = clock_->now_ms();

  if (decision == AdmissionDecision::Accepted) {
    tracker_.track(*order, steady_now_us());
    if (order_sink_ && !order_sink_(*order)) {
      std::cerr << "[Pipeline] " << config_.symbol << " WARNING: order_id="
                << order->id << " could not be dispatched; dropping it.\n";
      tracker_.erase(order->id);
      gate_.release(*order);
      decision = AdmissionDecision::DispatchFailed;
    }
  }

  if (decision == AdmissionDecision::Accepted) {
    last_rejection_.reset();
    ++orders_admitted_;
    if (monitor_) {
      monitor_->recordOrderSent();
    }
    bus_.publish(OrderAdmittedEvent{config_.symbol, *order, now_ms});
  } else {
    // Log only when the rejection reason changes: a tripped breaker rejects
    // every order for its whole duration.
    if (last_rejection_ != decision) {
      std::cout << "[Pipeline] " << config_.symbol << " rejecting orders: "
                << toString(decision) << "\n";
      last_rejection_ = decision;
    }

    ++orders_rejected_;
    if (monitor_) {
      monitor_->recordOrderRejected();
    }
    bus_.publish(OrderRejectedEvent{config_.symbol, *order, decision, now_ms});
  }

  if (monitor_) {
    monitor_->recordLatency(steady_now_us() - received_us);
  }
  return decision;
}

// -----------------------------------------------------------------------------
// handleFill()
// -----------------------------------------------------------------------------
bool Pipeline::handleFill(const domain::Fill& fill) {
  if (fill.rejected) {
    return onVenueReject(fill);
  }

  // A fill nobody is waiting for (a duplicate, or a late fill for an
  // abandoned order) still traded at the venue, so it is applied in full.
  auto outcome = tracker_.onFill(fill);
  if (!outcome) {
    std::cerr << "[Pipeline] " << config_.symbol
              << " WARNING: fill for unknown order_id=" << fill.order_id
              << "; applying it without a reservation.\n";
    ++unknown_fills_;
    gate_.absorbUnreservedFill(fill);
  }

  strategy_->onFill(fill);
  if (gate_.onFill(fill)) {
    onBreakerTripped();
  }

  ++fills_applied_;
  if (monitor_) {
    monitor_->recordFill();
    monitor_->setCumulativePnl(gate_.cumulativePnl());
    if (outcome) {
      monitor_->recordFillLatency(steady_now_us() - outcome->dispatched_us);
    }
  }

  bus_.publish(FillAppliedEvent{config_.symbol, fill, strategy_->position(),
                                gate_.cumulativePnl()});
  return outcome.has_value();
}

// -----------------------------------------------------------------------------
// run(): selection loop over the quote and fill channels
// -----------------------------------------------------------------------------
void Pipeline::run(BoundedChannel<domain::Quote>& quotes,
                   BoundedChannel<domain::Fill>& fills,
                   ReadinessSignal& readiness) {
  std::cout << "[Pipeline] " << config_.symbol << " event loop started.\n";

  std::optional<std::int64_t> last_progress_ms;  // set once draining

  while (true) {
    // Read the generation before polling so a push that races with the
    // polls below cannot be missed by the wait at the bottom.
    const auto seen = readiness.generation();

    if (auto fill = fills.try_pop()) {
      handleFill(*fill);
      if (last_progress_ms) {
        last_progress_ms = steady_now_ms();
      }
      continue;
    }

    if (auto quote = quotes.try_pop()) {
      handleQuote(*quote);
      continue;
    }

    if (quotes.drained()) {
      if (tracker_.inFlight() == 0) {
        break;
      }
      if (!last_progress_ms) {
        last_progress_ms = steady_now_ms();
        std::cout << "[Pipeline] " << config_.symbol
                  << " quote stream closed; draining " << tracker_.inFlight()
                  << " in-flight order(s).\n";
      }
      if (fills.drained()) {
        abandonInFlight("fill channel closed");
        break;
      }
      if (steady_now_ms() - *last_progress_ms >= config_.drain_timeout_ms) {
        abandonInFlight("drain timeout");
        break;
      }
    }

    readiness.wait_for(seen, kIdleWait);
  }

  std::cout << "[Pipeline] " << config_.symbol << " event loop finished: "
            << quotes_handled_ << " quotes, " << orders_admitted_
            << " admitted, " << orders_rejected_ << " rejected, "
            << fills_applied_ << " fills.\n";
}

// ---- private helpers ----

void Pipeline::onBreakerTripped() {
  const RiskState state = gate_.state();
  if (monitor_) {
    monitor_->recordCircuitBreakerTrip();
  }
  bus_.publish(CircuitBreakerEvent{config_.symbol, state.last_trip_reason,
                                   clock_->now_ms(), state.breaker_expiry_ms});
}

bool Pipeline::onVenueReject(const domain::Fill& report) {
  auto open = tracker_.take(report.order_id);
  if (!open) {
    std::cerr << "[Pipeline] " << config_.symbol
              << " WARNING: venue rejection for unknown order_id="
              << report.order_id << ". Ignoring.\n";
    return false;
  }

  gate_.release(open->order, open->remaining);
  ++venue_rejects_;
  std::cerr << "[Pipeline] " << config_.symbol << " WARNING: venue rejected "
            << "order_id=" << report.order_id << "; released "
            << open->remaining << " reserved.\n";
  return false;
}

void Pipeline::abandonInFlight(const char* reason) {
  const auto orders = tracker_.abandonAll();
  abandoned_orders_ += orders.size();
  std::cerr << "[Pipeline] " << config_.symbol << " WARNING: " << reason
            << "; abandoning " << orders.size() << " in-flight order(s):";
  for (const auto& open : orders) {
    gate_.release(open.order, open.remaining);
    std::cerr << " " << open.order.id;
  }
  std::cerr << "\n";
}

}  // namespace hft
