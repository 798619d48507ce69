#pragma once

#include "tradeguard/config/engine_config.hpp"
#include "tradeguard/domain/risk_limits.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @brief  Reads the engine's JSON configuration with nlohmann/json.
//
// @details
// Every section and key is optional; a missing key keeps the EngineConfig
// default. A key that is present must have the right type and a value in
// range. Layout:
//
//   {
//     "risk":       { "max_position_size": 500, "max_loss": 5000,
//                     "max_drawdown_percent": 10, "stop_loss_percent": 5,
//                     "stop_loss_action": "Reject",
//                     "take_profit_percent": 0,
//                     "max_exposure_percent": 50, "max_risk_percent": 2,
//                     "assumed_volatility_percent": 2,
//                     "escalate_alerts_to_halt": false },
//     "retry":      { "max_attempts": 3, "initial_backoff_ms": 50,
//                     "multiplier": 2.0, "max_backoff_ms": 1000 },
//     "timeouts":   { "venue_ms": 2000, "fill_ms": 30000 },
//     "monitor":    { "interval_ms": 1000, "alert_window_ms": 300000 },
//     "instruments": [ "AAPL", "MSFT" ],
//     "account":    { "initial_cash": 1000000,
//                     "positions": [ { "instrument": "AAPL",
//                                      "quantity": 100,
//                                      "average_cost": 150.0 } ] },
//     "network":    { "market_data": "tcp://127.0.0.1:5555",
//                     "command": "tcp://*:5556",
//                     "telemetry": "tcp://*:5557" },
//     "simulation": { "default_fill_price": 100.0 }
//   }
//
// Errors: every function throws domain::ConfigError, carrying the offending
// key, for unreadable files, malformed JSON, wrong types and out-of-range
// values. nlohmann exceptions never escape.
// -----------------------------------------------------------------------------

EngineConfig loadConfig(const std::string& path);

EngineConfig parseConfig(const nlohmann::json& root);

// The "risk" object on its own. Keys it omits keep their value from base,
// so a reconfiguration request may name only the limits it changes.
domain::RiskLimitConfig parseRiskLimits(const nlohmann::json& risk,
                                        domain::RiskLimitConfig base = {});

}  // namespace tradeguard
