#include "hft/risk/risk_gate.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace hft {

namespace {
constexpr std::int64_t kRateWindowMs = 1000;
}  // namespace

RiskGate::RiskGate(const PipelineConfig& config, const ITimeProvider& clock)
    : config_(config),
      clock_(clock),
      breaker_duration_ms_(config.circuitBreakerDurationMs()),
      ledger_(config.pnl_method) {}

// -----------------------------------------------------------------------------
// check(): the four admission rules, in order
// -----------------------------------------------------------------------------
AdmissionDecision RiskGate::check(const domain::Order& order) {
  const std::int64_t now = clock_.now_ms();

  // --- 1. Circuit breaker ---------------------------------------------------
  clearExpiredBreaker(now);
  if (breaker_active_) {
    ++rejected_;
    return AdmissionDecision::CircuitBreaker;
  }

  // --- 2. Rate limit ----------------------------------------------------------
  if (!window_started_ || now - window_start_ms_ >= kRateWindowMs) {
    window_started_ = true;
    window_start_ms_ = now;
    orders_this_window_ = 0;
  }
  if (orders_this_window_ >= config_.max_orders_per_second) {
    ++rejected_;
    return AdmissionDecision::RateLimit;
  }

  // --- 3. Position limit ------------------------------------------------------
  const double delta = domain::signedQuantity(order.side, order.quantity);
  if (std::abs(position_ + delta) > config_.max_position) {
    ++rejected_;
    return AdmissionDecision::PositionLimit;
  }

  // --- 4. Order value ---------------------------------------------------------
  if (order.notional() > config_.max_order_value) {
    ++rejected_;
    return AdmissionDecision::OrderValue;
  }

  position_ += delta;
  ++orders_this_window_;
  ++accepted_;
  return AdmissionDecision::Accepted;
}

// -----------------------------------------------------------------------------
// onQuote(): price-shock detection
// -----------------------------------------------------------------------------
bool RiskGate::onQuote(const domain::Quote& quote) {
  const std::int64_t now = clock_.now_ms();
  clearExpiredBreaker(now);

  const double mid = quote.mid();
  bool tripped = false;

  if (last_price_ && *last_price_ > 0.0) {
    const double change_pct = std::abs(mid - *last_price_) / *last_price_ * 100.0;
    if (change_pct > config_.circuit_breaker_pct) {
      std::cout << "[RiskGate] " << config_.symbol << " price shock: "
                << *last_price_ << " -> " << mid << " (" << change_pct
                << "% > " << config_.circuit_breaker_pct << "%)\n";
      tripBreaker(now, TripReason::PriceShock);
      tripped = true;
    }
  }

  last_price_ = mid;
  return tripped;
}

// -----------------------------------------------------------------------------
// onFill(): drawdown detection
// -----------------------------------------------------------------------------
bool RiskGate::onFill(const domain::Fill& fill) {
  ledger_.applyFill(fill);

  const double pnl = ledger_.pnl();
  peak_pnl_ = std::max(peak_pnl_, pnl);

  if (peak_pnl_ - pnl > config_.max_drawdown) {
    std::cout << "[RiskGate] " << config_.symbol << " drawdown breach: peak="
              << peak_pnl_ << " current=" << pnl
              << " limit=" << config_.max_drawdown << "\n";
    tripBreaker(clock_.now_ms(), TripReason::Drawdown);
    return true;
  }
  return false;
}

void RiskGate::release(const domain::Order& order, double quantity) {
  if (quantity <= 0.0) {
    return;
  }
  position_ -= domain::signedQuantity(order.side, quantity);
}

void RiskGate::absorbUnreservedFill(const domain::Fill& fill) {
  position_ += domain::signedQuantity(fill.side, fill.quantity);
}

bool RiskGate::breakerActive() const {
  return breaker_active_ && clock_.now_ms() < breaker_expiry_ms_;
}

RiskState RiskGate::state() const {
  RiskState s;
  s.orders_this_window = orders_this_window_;
  s.window_start_ms = window_start_ms_;
  s.position = position_;
  s.cumulative_pnl = ledger_.pnl();
  s.peak_pnl = peak_pnl_;
  s.breaker_active = breakerActive();
  s.breaker_expiry_ms = breaker_expiry_ms_;
  s.last_trip_reason = last_trip_reason_;
  s.last_price = last_price_;
  s.trip_count = trip_count_;
  s.accepted = accepted_;
  s.rejected = rejected_;
  return s;
}

// ---- private helpers ----

void RiskGate::clearExpiredBreaker(std::int64_t now_ms) {
  if (breaker_active_ && now_ms >= breaker_expiry_ms_) {
    breaker_active_ = false;
    std::cout << "[RiskGate] " << config_.symbol
              << " circuit breaker expired; admission resumes.\n";
  }
}

void RiskGate::tripBreaker(std::int64_t now_ms, TripReason reason) {
  const std::int64_t expiry = now_ms + breaker_duration_ms_;
  breaker_expiry_ms_ =
      breaker_active_ ? std::max(breaker_expiry_ms_, expiry) : expiry;
  breaker_active_ = true;
  last_trip_reason_ = reason;
  ++trip_count_;
}

}  // namespace hft
