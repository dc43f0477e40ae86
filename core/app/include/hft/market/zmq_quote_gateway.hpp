#pragma once

#include "hft/market/i_quote_source.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace hft {

// -----------------------------------------------------------------------------
// ZmqQuoteGateway — ZeroMQ bridge for an external quote feed
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded quotes and hands
//         each valid one to the sink.
//
// @details
// Expected JSON format from the publisher:
//   {
//     "timestamp_ms": 1700000000000,   // int64 milliseconds
//     "bid":          99.99,
//     "ask":          100.01,
//     "symbol":       "XYZ"            // optional
//   }
//
// When the gateway was built with a symbol filter, messages whose "symbol"
// names another instrument are ignored; messages without "symbol" are
// accepted. Malformed JSON, missing fields and quotes with bid >= ask are
// logged to stderr and skipped: one bad message never stops the feed.
//
// Shutdown safety (ZMQ_RCVTIMEO):
//   The socket has a receive timeout so recv() returns periodically and the
//   stop() flag is honoured even when the publisher is silent.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII).
//
// Thread model: run() on the market data thread; stop() from any thread.
// -----------------------------------------------------------------------------
class ZmqQuoteGateway final : public IQuoteSource {
 public:
  // @throws zmq::error_t if the endpoint cannot be connected.
  explicit ZmqQuoteGateway(const std::string& endpoint,
                           std::string symbol_filter = "");

  ZmqQuoteGateway(const ZmqQuoteGateway&) = delete;
  ZmqQuoteGateway& operator=(const ZmqQuoteGateway&) = delete;
  ZmqQuoteGateway(ZmqQuoteGateway&&) = delete;
  ZmqQuoteGateway& operator=(ZmqQuoteGateway&&) = delete;

  void run(const QuoteSink& sink) override;
  void stop() override;

  // Decodes one payload. Returns std::nullopt (after logging) for anything
  // that is not a valid quote for this gateway's symbol.
  std::optional<domain::Quote> decode(const std::string& payload) const;

  std::uint64_t skipped() const { return skipped_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  const std::string symbol_filter_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{true};
  mutable std::atomic<std::uint64_t> skipped_{0};
};

}  // namespace hft
