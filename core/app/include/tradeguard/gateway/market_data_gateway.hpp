#pragma once

#include "tradeguard/events/event_types.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// MarketDataGateway — ZeroMQ SUB bridge for market data ticks
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON ticks and hands each one
//         to the engine as a MarketDataEvent.
//
// @details
// Expected JSON format from the publisher:
//   {
//     "timestamp_ms": 1700000000000,   // int64 epoch milliseconds
//     "symbol":       "AAPL",          // instrument identifier
//     "price":        150.25,          // last trade price
//     "bid":          150.20,          // optional
//     "ask":          150.30,          // optional
//     "volume":       100.0            // optional
//   }
//
// Malformed messages are logged to std::cerr and skipped; they never stop
// the loop.
//
// Thread model:
//   run() blocks the calling thread (MarketDataThread's worker). stop() may
//   be called from any thread; the loop notices it within kRecvTimeoutMs
//   thanks to ZMQ_RCVTIMEO.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t. Holds a copy of the sink,
//   which TradingEngine binds to pushMarketData().
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using TickSink = std::function<void(const MarketDataEvent&)>;

  MarketDataGateway(TickSink sink, const std::string& endpoint);

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // parseTick(payload)
  // -------------------------------------------------------------------------
  // Decodes one JSON tick. Throws nlohmann::json::exception when the payload
  // is not JSON or a required field is missing or mistyped.
  // -------------------------------------------------------------------------
  static MarketDataEvent parseTick(const std::string& payload);

  std::uint64_t ticksReceived() const { return sequence_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  TickSink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace tradeguard
