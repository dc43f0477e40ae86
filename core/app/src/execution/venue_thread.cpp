#include "hft/execution/venue_thread.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace hft {

VenueThread::VenueThread(std::string symbol,
                         std::unique_ptr<IExecutionVenue> venue,
                         BoundedChannel<domain::Fill>& fills)
    : symbol_(std::move(symbol)), venue_(std::move(venue)), fills_(fills) {}

VenueThread::~VenueThread() {
  shutdown();
  join();
}

void VenueThread::start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

bool VenueThread::submit(const domain::Order& order) {
  return orders_.push(order);
}

void VenueThread::shutdown() { orders_.close(); }

void VenueThread::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

// -----------------------------------------------------------------------------
// run(): execute orders until the queue is closed and drained
// -----------------------------------------------------------------------------
void VenueThread::run() {
  std::cout << "[VenueThread] " << symbol_ << " started.\n";

  bool fills_open = true;
  while (fills_open) {
    auto order = orders_.pop();
    if (!order) {
      break;
    }

    std::vector<domain::Fill> fills;
    try {
      fills = venue_->execute(*order);
      executed_.fetch_add(1);
    } catch (const std::exception& e) {
      // Report the failure through the fill channel so the pipeline drops
      // the order on its own thread.
      std::cerr << "[VenueThread] " << symbol_ << " execution of order_id="
                << order->id << " failed: " << e.what() << "\n";
      domain::Fill report;
      report.order_id = order->id;
      report.side = order->side;
      report.price = order->price;
      report.rejected = true;
      fills.push_back(report);
      failed_.fetch_add(1);
    }

    for (const auto& fill : fills) {
      if (!fills_.push(fill)) {
        std::cerr << "[VenueThread] " << symbol_
                  << " fill channel closed; dropping remaining fills.\n";
        fills_open = false;
        break;
      }
    }
  }

  fills_.close();
  std::cout << "[VenueThread] " << symbol_ << " stopped after "
            << executed_.load() << " orders.\n";
}

}  // namespace hft
