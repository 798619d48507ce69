#pragma once

#include "tradeguard/domain/alert.hpp"

namespace tradeguard {

// -----------------------------------------------------------------------------
// AlertEvent — broadcast of a newly appended Alert
// -----------------------------------------------------------------------------
//
// @brief  Published by AlertLog::raise() after the alert is stored.
//
// @details
// The append-only feed external collaborators subscribe to. Telemetry
// forwards it over the IPC PUB socket; TradingEngine also listens for it to
// apply halt escalation when RiskLimitConfig::escalate_alerts_to_halt is set.
//
// Ownership:
//   Value type. The Alert is a copy of the stored record.
// -----------------------------------------------------------------------------
struct AlertEvent {
  domain::Alert alert;
};

}  // namespace tradeguard
