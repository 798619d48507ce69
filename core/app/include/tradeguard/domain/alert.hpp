#pragma once

#include "tradeguard/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace tradeguard {
namespace domain {

enum class AlertSeverity {
  Info,
  Warning,
  Critical,
};

// -----------------------------------------------------------------------------
// Alert — a raised risk condition
// -----------------------------------------------------------------------------
//
// @brief  Append-only record stored in AlertLog and broadcast as an
//         AlertEvent.
//
// @details
// source names what raised it: a monitored metric ("exposure_percent",
// "risk_percent", "drawdown_percent", "session_loss") or a runtime fault
// ("ledger_inconsistency", "venue_failure"). Alerts never influence
// admission decisions; they only trigger a halt when escalation is enabled
// in RiskLimitConfig.
// -----------------------------------------------------------------------------
struct Alert {
  std::uint64_t id{0};
  AlertSeverity severity{AlertSeverity::Info};
  std::string source;
  std::string message;
  double value{0.0};
  double threshold{0.0};
  Timestamp timestamp{};
};

}  // namespace domain
}  // namespace tradeguard
