#pragma once

namespace tradeguard {
namespace domain {

// What the StopLoss rule asks for when it fires.
enum class StopLossAction {
  Reject,         // Refuse the exposure-increasing order
  ForceFlatten,   // Refuse it and flag the position for flattening
};

// -----------------------------------------------------------------------------
// RiskLimitConfig — configured thresholds for one trading session
// -----------------------------------------------------------------------------
// All thresholds are >= 0 and a threshold of exactly 0 disables its rule.
// Percentages are in percent units (10.0 means 10 %).
//
// Held behind std::shared_ptr<const RiskLimitConfig> by RiskConfigStore, so
// once published an instance is never mutated; reconfiguration swaps in a
// new instance.
// -----------------------------------------------------------------------------
struct RiskLimitConfig {
  /// Maximum absolute position per instrument, in tradable units.
  double max_position_size{10000.0};

  /// Maximum session loss (realized + unrealized) in account currency.
  double max_loss{5000.0};

  /// Maximum decline from the peak portfolio value, in percent.
  double max_drawdown_percent{10.0};

  /// Maximum unrealized loss on an open position, in percent of its cost.
  double stop_loss_percent{5.0};
  StopLossAction stop_loss_action{StopLossAction::Reject};

  /// Unrealized gain on an open position, in percent of its cost, at which
  /// the position is due to be closed. 0 (the default) disables the rule.
  double take_profit_percent{0.0};

  /// Risk Monitor thresholds (alerting only).
  double max_exposure_percent{50.0};
  double max_risk_percent{2.0};

  /// Stop distance assumed for risk percent when stop_loss_percent is 0.
  double assumed_volatility_percent{2.0};

  /// When true, Risk Monitor alerts halt intake and cancel working parents.
  bool escalate_alerts_to_halt{false};
};

}  // namespace domain
}  // namespace tradeguard
