#pragma once

#include "tradeguard/time/time_utils.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// RiskSnapshot
// -----------------------------------------------------------------------------
// Point-in-time result of RiskMonitor::tick(). Derived data only: it can
// always be recomputed from a LedgerSnapshot and a RiskLimitConfig, and is
// never treated as a source of truth.
//
// breached lists the metric names currently above their thresholds,
// regardless of whether an alert was raised on this tick.
// -----------------------------------------------------------------------------
struct RiskSnapshot {
  double exposure_percent{0.0};
  double risk_percent{0.0};
  double drawdown_percent{0.0};
  double session_loss{0.0};
  double portfolio_value{0.0};
  std::vector<std::string> breached;
  std::size_t alerts_in_window{0};
  Timestamp timestamp{};
};

}  // namespace domain
}  // namespace tradeguard
