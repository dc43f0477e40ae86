#include "hft/market/zmq_quote_gateway.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace hft {

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout
// -----------------------------------------------------------------------------
ZmqQuoteGateway::ZmqQuoteGateway(const std::string& endpoint,
                                 std::string symbol_filter)
    : symbol_filter_(std::move(symbol_filter)) {
  // Topic filtering happens on the decoded "symbol" field, not on a
  // message prefix, so subscribe to everything.
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void ZmqQuoteGateway::run(const QuoteSink& sink) {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // timeout: re-check the stop flag
    }

    auto quote = decode(msg.to_string());
    if (!quote) {
      continue;
    }
    if (!sink(*quote)) {
      break;
    }
  }
}

void ZmqQuoteGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// decode(): JSON payload -> Quote
// -----------------------------------------------------------------------------
std::optional<domain::Quote> ZmqQuoteGateway::decode(
    const std::string& payload) const {
  try {
    auto json = nlohmann::json::parse(payload);

    if (!symbol_filter_.empty()) {
      auto it = json.find("symbol");
      if (it != json.end() && it->get<std::string>() != symbol_filter_) {
        return std::nullopt;
      }
    }

    domain::Quote quote;
    quote.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    quote.bid = json.at("bid").get<double>();
    quote.ask = json.at("ask").get<double>();

    if (!quote.isValid()) {
      std::cerr << "[ZmqQuoteGateway] dropping crossed or non-positive quote"
                << " bid=" << quote.bid << " ask=" << quote.ask << "\n";
      skipped_.fetch_add(1);
      return std::nullopt;
    }
    return quote;

  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqQuoteGateway] JSON error: " << e.what()
              << " payload: " << payload << "\n";
    skipped_.fetch_add(1);
    return std::nullopt;
  }
}

}  // namespace hft
