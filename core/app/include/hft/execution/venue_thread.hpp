#pragma once

#include "hft/concurrent/bounded_channel.hpp"
#include "hft/concurrent/thread_safe_queue.hpp"
#include "hft/domain/fill.hpp"
#include "hft/domain/order.hpp"
#include "hft/execution/i_execution_venue.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace hft {

// -----------------------------------------------------------------------------
// VenueThread — dedicated thread that runs the execution venue
// -----------------------------------------------------------------------------
//
// @brief  Takes admitted orders from an unbounded queue, executes them on an
//         IExecutionVenue, and pushes the fills into the bounded fill
//         channel.
//
// @details
//   pipeline thread                     venue thread
//   ───────────────                     ────────────
//   submit(order) ──push()──▶ order queue
//                                │
//                          venue_->execute(order)
//                                │
//   fill channel ◀──push()──────┘  (blocks while full)
//
// An order whose execute() throws is answered with a single Fill marked
// `rejected` (zero quantity) so the pipeline can drop it.
//
// The order queue is unbounded so submit() never blocks the pipeline, which
// is also the fill channel's only consumer. Growth is bounded by the
// RiskGate's rate limit.
//
// shutdown() closes the order queue. The thread executes whatever is still
// queued, then closes the fill channel and exits.
//
// Thread model:
//   submit() from the pipeline thread. start()/shutdown()/join() from the
//   owning thread (InstrumentEngine).
//
// Ownership:
//   Owns the venue and the order queue. Holds a reference to the fill
//   channel owned by InstrumentEngine.
// -----------------------------------------------------------------------------
class VenueThread {
 public:
  VenueThread(std::string symbol,
              std::unique_ptr<IExecutionVenue> venue,
              BoundedChannel<domain::Fill>& fills);

  // RAII: shutdown() and join().
  ~VenueThread();

  VenueThread(const VenueThread&) = delete;
  VenueThread& operator=(const VenueThread&) = delete;
  VenueThread(VenueThread&&) = delete;
  VenueThread& operator=(VenueThread&&) = delete;

  // Idempotent.
  void start();

  // Enqueues an admitted order. Returns false after shutdown().
  bool submit(const domain::Order& order);

  void shutdown();
  void join();

  std::uint64_t executed() const { return executed_.load(); }
  std::uint64_t failed() const { return failed_.load(); }

 private:
  void run();

  const std::string symbol_;
  std::unique_ptr<IExecutionVenue> venue_;
  BoundedChannel<domain::Fill>& fills_;
  ThreadSafeQueue<domain::Order> orders_;

  std::atomic<std::uint64_t> executed_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::thread thread_;
};

}  // namespace hft
