#pragma once

#include "tradeguard/domain/alert.hpp"
#include "tradeguard/domain/error_code.hpp"
#include "tradeguard/domain/order_intent.hpp"
#include "tradeguard/domain/order_status.hpp"
#include "tradeguard/domain/risk_decision.hpp"
#include "tradeguard/domain/risk_limits.hpp"

#include <optional>
#include <string>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// Enum ↔ string conversions
// -----------------------------------------------------------------------------
// Used for log lines, IPC telemetry JSON and configuration parsing. The
// strings are part of the wire format; do not rename them casually.
// -----------------------------------------------------------------------------
const char* toString(Side side);
const char* toString(SliceStatus status);
const char* toString(ParentStatus status);
const char* toString(RiskRuleId rule);
const char* toString(RiskAction action);
const char* toString(AlertSeverity severity);
const char* toString(ErrorCode code);
const char* toString(StopLossAction action);

// Name of the algorithm held by a PacingSpec ("TWAP", "VWAP", ...).
const char* pacingName(const PacingSpec& pacing);

std::optional<Side> parseSide(const std::string& text);
std::optional<StopLossAction> parseStopLossAction(const std::string& text);

}  // namespace domain
}  // namespace tradeguard
