#pragma once

#include "tradeguard/domain/alert.hpp"
#include "tradeguard/domain/child_order_slice.hpp"
#include "tradeguard/domain/order_intent.hpp"
#include "tradeguard/domain/parent_order_report.hpp"
#include "tradeguard/domain/position.hpp"
#include "tradeguard/domain/risk_decision.hpp"
#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/domain/risk_snapshot.hpp"

#include <nlohmann/json.hpp>

namespace tradeguard {

// -----------------------------------------------------------------------------
// JSON codec for the IPC command and telemetry channels
// -----------------------------------------------------------------------------
// Field names are part of the wire format consumed by external dashboards
// and bots. Enums are written with domain::toString(); timestamps as epoch
// milliseconds.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::AggregatePosition& aggregate);
nlohmann::json toJson(const domain::ChildOrderSlice& slice);
nlohmann::json toJson(const domain::RuleViolation& violation);
nlohmann::json toJson(const domain::ParentOrderReport& report);
nlohmann::json toJson(const domain::RiskSnapshot& snapshot);
nlohmann::json toJson(const domain::Alert& alert);
nlohmann::json toJson(const domain::RiskLimitConfig& limits);

// -----------------------------------------------------------------------------
// intentFromJson(j)
// -----------------------------------------------------------------------------
// Parses a SUBMIT payload:
//
//   { "instrument": "AAPL", "side": "Buy", "quantity": 1000,
//     "limit_price": 150.25,                                  // optional
//     "pacing": { "algorithm": "TWAP", "slices": 7, "horizon_ms": 60000 } }
//
//   VWAP:        "weights": [..], "horizon_ms"
//   Iceberg:     "clip_size", "interval_ms"
//   MinSlippage: "clip_size", "interval_ms", "base_spread_bps"
//   Participation (also "POV", "PARTICIPATE"):
//                "participation_rate", "clip_size", "interval_ms"
//
// Missing pacing parameters keep their defaults. Only the shape is checked
// here; quantity, instrument and parameter ranges are validated at intake.
// Quantities, clip sizes and durations must be whole numbers and slices
// must not be negative: 100.7 or -5 is refused, never truncated or wrapped.
//
// Throws nlohmann::json::exception for missing keys or wrong types, and
// std::invalid_argument for an unknown side or algorithm or a number of the
// wrong kind.
// -----------------------------------------------------------------------------
domain::OrderIntent intentFromJson(const nlohmann::json& j);

}  // namespace tradeguard
