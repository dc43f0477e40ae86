#pragma once

#include "hft/config/pipeline_config.hpp"
#include "hft/domain/fill.hpp"
#include "hft/domain/order.hpp"
#include "hft/domain/quote.hpp"
#include "hft/risk/admission_decision.hpp"
#include "hft/risk/position_ledger.hpp"
#include "hft/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>

namespace hft {

// -----------------------------------------------------------------------------
// RiskState — observable snapshot of the gate
// -----------------------------------------------------------------------------
struct RiskState {
  std::uint32_t orders_this_window{0};
  std::int64_t window_start_ms{0};
  double position{0.0};            // reserved net position
  double cumulative_pnl{0.0};
  double peak_pnl{0.0};
  bool breaker_active{false};
  std::int64_t breaker_expiry_ms{0};
  TripReason last_trip_reason{TripReason::None};
  std::optional<double> last_price;  // last mid seen by onQuote()
  std::uint64_t trip_count{0};
  std::uint64_t accepted{0};
  std::uint64_t rejected{0};
};

// -----------------------------------------------------------------------------
// RiskGate — pre-trade admission control for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Decides whether each strategy order may reach the venue, and runs
//         the circuit breaker from the quote and fill streams.
//
// @details
// check() evaluates the rules in a fixed order and stops at the first
// failure. A rejection leaves the gate untouched.
//
//   1. Circuit breaker: tripped and not yet expired → CircuitBreaker.
//   2. Rate limit: orders admitted in the current 1 s window have reached
//      max_orders_per_second → RateLimit. The window starts at the first
//      check and restarts lazily once now - window_start >= 1000 ms.
//   3. Position limit: |position + signed qty| > max_position
//      → PositionLimit.
//   4. Order value: quantity * price > max_order_value → OrderValue.
//
// On acceptance the order's signed quantity is reserved against the gate's
// position immediately (fills do not move it again) and the window counter
// increments. release() hands back the unfilled part of a reservation when
// the order dies without trading: refused dispatch, venue rejection or
// abandonment. A fill that arrives with no reservation behind it (its order
// was already released) moves the position through absorbUnreservedFill().
// Together these keep position() equal to the net filled quantity plus the
// open remainder of every live order.
//
// Circuit breaker:
//   Normal ──(price shock | drawdown breach)──▶ Tripped
//   Tripped ──(trip again)──▶ Tripped, expiry extended
//   Tripped ──(now >= expiry, seen by check()/onQuote())──▶ Normal
//
//   Price shock:     |mid - last_mid| / last_mid * 100 > circuit_breaker_pct.
//                    The first quote only records the mid.
//   Drawdown breach: peak_pnl - cumulative_pnl > max_drawdown, with PnL
//                    measured by the configured PnlMethod and peak starting
//                    at zero.
//
// There is no manual reset.
//
// Time:
//   All rules read now_ms() from the injected ITimeProvider. Pipelines in
//   simulated-clock mode advance it to each quote's timestamp, which keeps
//   replays deterministic.
//
// Thread model:
//   Not thread-safe. Every call happens on the pipeline thread; other
//   threads only ever see RiskState copies published through events.
//
// Ownership:
//   Owned by Pipeline. Holds references to the PipelineConfig and the time
//   provider, both of which outlive it.
// -----------------------------------------------------------------------------
class RiskGate {
 public:
  RiskGate(const PipelineConfig& config, const ITimeProvider& clock);

  RiskGate(const RiskGate&) = delete;
  RiskGate& operator=(const RiskGate&) = delete;

  // -------------------------------------------------------------------------
  // check(order)
  // -------------------------------------------------------------------------
  // @brief  Runs every admission rule; reserves the order on acceptance.
  // @return Accepted, or the first rule that failed.
  // -------------------------------------------------------------------------
  AdmissionDecision check(const domain::Order& order);

  // Boolean form of check().
  bool allow(const domain::Order& order) {
    return check(order) == AdmissionDecision::Accepted;
  }

  // -------------------------------------------------------------------------
  // onQuote(quote)
  // -------------------------------------------------------------------------
  // @brief  Clears an expired breaker, then trips it on a price shock.
  //         Records the quote's mid as the last price either way.
  // @return true if this quote tripped (or re-tripped) the breaker.
  // -------------------------------------------------------------------------
  bool onQuote(const domain::Quote& quote);

  // -------------------------------------------------------------------------
  // onFill(fill)
  // -------------------------------------------------------------------------
  // @brief  Updates cumulative and peak PnL; trips the breaker on a drawdown
  //         breach.
  // @return true if this fill tripped (or re-tripped) the breaker.
  // -------------------------------------------------------------------------
  bool onFill(const domain::Fill& fill);

  // -------------------------------------------------------------------------
  // release(order, quantity)
  // -------------------------------------------------------------------------
  // @brief  Takes `quantity` units of the order's reservation back out of the
  //         position. The rate window is not refunded.
  // -------------------------------------------------------------------------
  void release(const domain::Order& order, double quantity);
  void release(const domain::Order& order) { release(order, order.quantity); }

  // Moves the position by a fill whose order holds no reservation. PnL still
  // goes through onFill().
  void absorbUnreservedFill(const domain::Fill& fill);

  // -------------------------------------------------------------------------
  // hydratePosition(net_quantity)
  // -------------------------------------------------------------------------
  // Warm-up only: seeds the reserved position, e.g. with inventory carried
  // from a previous session. Must be called before the first check().
  // -------------------------------------------------------------------------
  void hydratePosition(double net_quantity) { position_ = net_quantity; }

  // True while the breaker is tripped and unexpired at now_ms(). Read-only:
  // does not clear an expired breaker.
  bool breakerActive() const;

  double position() const { return position_; }
  double cumulativePnl() const { return ledger_.pnl(); }

  RiskState state() const;

 private:
  void clearExpiredBreaker(std::int64_t now_ms);
  void tripBreaker(std::int64_t now_ms, TripReason reason);

  const PipelineConfig& config_;
  const ITimeProvider& clock_;
  const std::int64_t breaker_duration_ms_;

  // --- Rate window ------------------------------------------------------------
  bool window_started_{false};
  std::int64_t window_start_ms_{0};
  std::uint32_t orders_this_window_{0};

  // --- Exposure and PnL -------------------------------------------------------
  double position_{0.0};
  PositionLedger ledger_;
  double peak_pnl_{0.0};

  // --- Circuit breaker --------------------------------------------------------
  bool breaker_active_{false};
  std::int64_t breaker_expiry_ms_{0};
  TripReason last_trip_reason_{TripReason::None};
  std::optional<double> last_price_;
  std::uint64_t trip_count_{0};

  std::uint64_t accepted_{0};
  std::uint64_t rejected_{0};
};

}  // namespace hft
