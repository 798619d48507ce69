#pragma once

#include "tradeguard/gateway/market_data_gateway.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace tradeguard {

// -----------------------------------------------------------------------------
// MarketDataThread — restartable market data ingestion session
// -----------------------------------------------------------------------------
//
// @brief  Runs one MarketDataGateway session at a time on its own thread.
//
// @details
// Each start() opens a fresh session: a new gateway (and ZMQ socket) is
// connected to the configured endpoint and its recv loop runs on a new
// thread. stop() ends the session and joins the thread, so start() may be
// called again later. The tick count runs across sessions.
//
// A gateway that cannot connect (malformed endpoint, unsupported transport)
// makes start() return false after logging; no thread is spawned. A ZMQ
// error raised inside the recv loop ends the session and is logged.
//
// Thread model: start(), stop() and restart() from the owning thread.
// running() and ticksReceived() may be read from any thread. The sink runs
// on the session thread.
//
// Ownership: Owned by TradingEngine via std::unique_ptr. Owns the gateway
// of the current session.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  MarketDataThread(MarketDataGateway::TickSink sink, std::string endpoint);

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // Opens a session. Returns true when a session is live afterwards,
  // including when one already was.
  bool start();

  // Ends the current session, if any.
  void stop();

  // stop() followed by start().
  bool restart();

  bool running() const { return session_live_.load(); }
  const std::string& endpoint() const { return endpoint_; }

  // Ticks over every session so far, the live one included.
  std::uint64_t ticksReceived() const { return ticks_.load(); }

  // Sessions opened successfully since construction.
  std::uint64_t sessionsOpened() const { return sessions_.load(); }

 private:
  void runSession(std::uint64_t session);

  MarketDataGateway::TickSink sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread worker_;

  std::atomic<bool> session_live_{false};
  std::atomic<std::uint64_t> sessions_{0};
  std::atomic<std::uint64_t> ticks_{0};
};

}  // namespace tradeguard
