#pragma once

#include "tradeguard/domain/position.hpp"
#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/execution/retry_policy.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// EngineConfig — everything TradingEngine needs for one session
// -----------------------------------------------------------------------------
// Built by loadConfig() from config/tradeguard.json, or filled in directly
// by tests. An empty endpoint disables the corresponding ZeroMQ socket, so a
// default-constructed config runs fully in-process.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::RiskLimitConfig risk;
  RetryPolicy retry;

  std::chrono::milliseconds venue_timeout{2000};    // Per submission attempt
  std::chrono::milliseconds fill_timeout{30000};    // Per slice, after ack
  std::chrono::milliseconds monitor_interval{1000};
  std::chrono::milliseconds alert_window{std::chrono::minutes(5)};

  // Tradable instruments; intents for anything else fail UnknownInstrument.
  std::vector<std::string> instruments;

  double initial_cash{1000000.0};
  std::vector<domain::Position> initial_positions;

  std::string market_data_endpoint;   // SUB, connect
  std::string command_endpoint;       // REP, bind
  std::string telemetry_endpoint;     // PUB, bind

  // SimulatedVenue price when neither a limit nor market data is available.
  double simulated_fill_price{100.0};
};

}  // namespace tradeguard
