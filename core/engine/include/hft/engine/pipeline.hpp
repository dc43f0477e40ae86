#pragma once

#include "hft/concurrent/bounded_channel.hpp"
#include "hft/concurrent/order_id_generator.hpp"
#include "hft/config/pipeline_config.hpp"
#include "hft/domain/fill.hpp"
#include "hft/domain/order.hpp"
#include "hft/domain/quote.hpp"
#include "hft/eventbus/event_bus.hpp"
#include "hft/monitoring/performance_monitor.hpp"
#include "hft/risk/admission_decision.hpp"
#include "hft/risk/order_tracker.hpp"
#include "hft/risk/risk_gate.hpp"
#include "hft/strategy/i_strategy.hpp"
#include "hft/time/i_time_provider.hpp"
#include "hft/time/simulation_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace hft {

// -----------------------------------------------------------------------------
// Pipeline — single-consumer event loop for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Owns the strategy and the RiskGate of one instrument and drives
//         them from the quote and fill streams.
//
// @details
// Quote path (handleQuote):
//   1. Simulated clock only: advance the clock to quote.timestamp_ms.
//   2. gate.onQuote(quote)             — circuit breaker on price shocks
//   3. strategy.onQuote(quote)         — at most one order
//   4. gate.check(order)
//      Accepted → track as in flight, hand to the order sink,
//                 publish OrderAdmittedEvent.
//      Rejected → drop (never retried), count, publish OrderRejectedEvent.
//      Sink refused the order → release the gate reservation, then handle
//                 it as a rejection with DispatchFailed.
//
// Fill path (handleFill):
//   1. Venue rejection report → drop the order and release the unfilled
//      part of its reservation. Nothing else happens.
//   2. Reconcile with the in-flight order. A fill for an unknown order (a
//      duplicate, or late for an abandoned order) is counted and moves the
//      gate position directly, since no reservation covers it.
//   3. strategy.onFill(fill), then gate.onFill(fill) — drawdown breaker
//   4. Publish FillAppliedEvent.
//
// The gate's position therefore always equals the strategy's inventory plus
// the unfilled quantity of the orders still in flight.
//
// run() is the selection loop over the two bounded channels:
//   - fills are taken before quotes whenever both are ready; each channel is
//     consumed strictly FIFO;
//   - it returns once the quote channel is closed and drained AND no
//     admitted order is still in flight;
//   - while draining, if the fill channel closes or drain_timeout_ms passes
//     without a fill, the remaining in-flight orders are abandoned with a
//     warning and their reservations released.
//
// Clock:
//   ClockMode::Simulated → an owned SimulationTimeProvider, advanced to each
//                          quote's timestamp. Replaying the same quotes and
//                          fills through a fresh Pipeline yields identical
//                          decisions, inventory and risk state.
//   ClockMode::Live      → LiveTimeProvider.
//
// Thread model:
//   handleQuote()/handleFill()/run() on one thread only (the pipeline
//   thread). EventBus callbacks run on that thread.
//
// Ownership:
//   Owns a copy of the config, the clock, the order id generator, the
//   strategy, the gate, the order tracker and the EventBus. The monitor is
//   borrowed (may be null) and must outlive the pipeline.
// -----------------------------------------------------------------------------
class Pipeline {
 public:
  // Receives every admitted order. Returns false if the order could not be
  // dispatched (venue shut down); the order is then untracked, its
  // reservation released, and it counts as rejected.
  using OrderSink = std::function<bool(const domain::Order&)>;

  // @throws ConfigError if config fails validation.
  Pipeline(PipelineConfig config,
           OrderSink order_sink,
           PerformanceMonitor* monitor = nullptr);

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;
  Pipeline(Pipeline&&) = delete;
  Pipeline& operator=(Pipeline&&) = delete;

  // -------------------------------------------------------------------------
  // handleQuote(quote)
  // -------------------------------------------------------------------------
  // @return std::nullopt if the strategy produced no order, otherwise the
  //         gate's decision on it (DispatchFailed if the sink refused it).
  // -------------------------------------------------------------------------
  std::optional<AdmissionDecision> handleQuote(const domain::Quote& quote);

  // -------------------------------------------------------------------------
  // handleFill(fill)
  // -------------------------------------------------------------------------
  // @return true if the fill reconciled an in-flight order. false for a
  //         venue rejection report or a fill for an unknown order (which
  //         is still applied).
  // -------------------------------------------------------------------------
  bool handleFill(const domain::Fill& fill);

  // -------------------------------------------------------------------------
  // run(quotes, fills, readiness)
  // -------------------------------------------------------------------------
  // @brief  Blocks until shutdown (see class comment).
  //
  // @param  readiness  The signal both channels were constructed with.
  // -------------------------------------------------------------------------
  void run(BoundedChannel<domain::Quote>& quotes,
           BoundedChannel<domain::Fill>& fills,
           ReadinessSignal& readiness);

  EventBus& eventBus() { return bus_; }
  const ITimeProvider& clock() const { return *clock_; }
  const PipelineConfig& config() const { return config_; }

  const IStrategy& strategy() const { return *strategy_; }
  IStrategy& strategy() { return *strategy_; }
  const RiskGate& riskGate() const { return gate_; }
  RiskGate& riskGate() { return gate_; }

  std::size_t inFlightOrders() const { return tracker_.inFlight(); }

  std::uint64_t quotesHandled() const { return quotes_handled_; }
  std::uint64_t ordersAdmitted() const { return orders_admitted_; }
  std::uint64_t ordersRejected() const { return orders_rejected_; }
  std::uint64_t fillsApplied() const { return fills_applied_; }
  std::uint64_t unknownFills() const { return unknown_fills_; }
  std::uint64_t abandonedOrders() const { return abandoned_orders_; }
  std::uint64_t venueRejects() const { return venue_rejects_; }

 private:
  void onBreakerTripped();
  bool onVenueReject(const domain::Fill& report);
  void abandonInFlight(const char* reason);

  const PipelineConfig config_;

  // clock_ owns the provider; sim_clock_ aliases it in simulated mode.
  std::unique_ptr<ITimeProvider> clock_;
  SimulationTimeProvider* sim_clock_{nullptr};

  OrderIdGenerator id_gen_;
  std::unique_ptr<IStrategy> strategy_;
  RiskGate gate_;
  OrderTracker tracker_;
  EventBus bus_;

  OrderSink order_sink_;
  PerformanceMonitor* monitor_;

  std::optional<AdmissionDecision> last_rejection_;

  std::uint64_t quotes_handled_{0};
  std::uint64_t orders_admitted_{0};
  std::uint64_t orders_rejected_{0};
  std::uint64_t fills_applied_{0};
  std::uint64_t unknown_fills_{0};
  std::uint64_t abandoned_orders_{0};
  std::uint64_t venue_rejects_{0};
};

}  // namespace hft
