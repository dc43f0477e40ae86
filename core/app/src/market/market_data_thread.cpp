#include "hft/market/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace hft {

MarketDataThread::MarketDataThread(std::string symbol,
                                   std::unique_ptr<IQuoteSource> source,
                                   BoundedChannel<domain::Quote>& quotes)
    : symbol_(std::move(symbol)), source_(std::move(source)), quotes_(quotes) {}

MarketDataThread::~MarketDataThread() {
  stop();
  join();
}

// -----------------------------------------------------------------------------
// start(): spawn the producer thread
// -----------------------------------------------------------------------------
void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] " << symbol_ << " source started.\n";

    source_->run([this](const domain::Quote& quote) {
      if (!quotes_.push(quote)) {
        return false;
      }
      published_.fetch_add(1);
      return true;
    });

    quotes_.close();
    std::cout << "[MarketDataThread] " << symbol_ << " source finished after "
              << published_.load() << " quotes; quote channel closed.\n";
  });
}

void MarketDataThread::stop() { source_->stop(); }

void MarketDataThread::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

}  // namespace hft
