#pragma once

#include "tradeguard/domain/position.hpp"
#include "tradeguard/domain/risk_decision.hpp"
#include "tradeguard/domain/risk_limits.hpp"

#include <atomic>
#include <cstdint>
#include <optional>

namespace tradeguard {

// -----------------------------------------------------------------------------
// RiskRuleEngine — pre-trade admission rules
// -----------------------------------------------------------------------------
//
// @brief  Evaluates a proposed change in exposure against a ledger snapshot
//         and the configured limits. Returns every violated rule.
//
// @details
// Rules run in a fixed order and all of them run; there is no
// short-circuit:
//
//   MaxSize      |current qty + delta| > max_position_size
//   MaxLoss      session loss (-session_pnl) > max_loss
//   MaxDrawdown  portfolio value < (1 - max_drawdown_percent / 100) * peak
//   StopLoss     exposure-increasing delta on a position whose unrealized
//                loss exceeds stop_loss_percent of its cost basis; the
//                violation carries the configured action (Reject or
//                ForceFlatten)
//   TakeProfit   exposure-increasing delta on a position whose unrealized
//                gain has reached take_profit_percent of its cost basis
//                (long: mark >= avg * (1 + tp); short: mark <= avg *
//                (1 - tp)); the action is ClosePosition
//
// A threshold of 0 disables its rule. StopLoss and TakeProfit ignore deltas
// that reduce or close the position, so flattening orders always get
// through them.
//
// The engine is stateless apart from an evaluation counter, so one instance
// is shared by the intake path and every parent task. Callers pass in the
// snapshot and limits they want evaluated; it never reads the ledger itself.
//
// Thread-safety: evaluate() is const and safe from any thread.
// -----------------------------------------------------------------------------
class RiskRuleEngine {
 public:
  RiskRuleEngine() = default;

  RiskRuleEngine(const RiskRuleEngine&) = delete;
  RiskRuleEngine& operator=(const RiskRuleEngine&) = delete;

  // -------------------------------------------------------------------------
  // evaluate(delta, snapshot, limits)
  // -------------------------------------------------------------------------
  // @param  delta     Signed change in the instrument's position.
  // @param  snapshot  Ledger state the decision is made against.
  // @param  limits    Configuration in force for this evaluation.
  //
  // @return RiskDecision; accepted() iff no rule is violated.
  // -------------------------------------------------------------------------
  domain::RiskDecision evaluate(const domain::ProposedDelta& delta,
                                const domain::LedgerSnapshot& snapshot,
                                const domain::RiskLimitConfig& limits) const;

  // Total evaluate() calls since construction.
  std::uint64_t evaluationCount() const { return evaluations_.load(); }

  // Individual rules, exposed for unit tests and diagnostics.
  static std::optional<domain::RuleViolation> checkMaxSize(
      const domain::Position& position, domain::Quantity signed_delta,
      const domain::RiskLimitConfig& limits);

  static std::optional<domain::RuleViolation> checkMaxLoss(
      const domain::AggregatePosition& aggregate,
      const domain::RiskLimitConfig& limits);

  static std::optional<domain::RuleViolation> checkMaxDrawdown(
      const domain::AggregatePosition& aggregate,
      const domain::RiskLimitConfig& limits);

  static std::optional<domain::RuleViolation> checkStopLoss(
      const domain::Position& position, domain::Quantity signed_delta,
      const domain::RiskLimitConfig& limits);

  static std::optional<domain::RuleViolation> checkTakeProfit(
      const domain::Position& position, domain::Quantity signed_delta,
      const domain::RiskLimitConfig& limits);

  // Unrealized loss of an open position as a percent of its cost basis.
  // Positive when losing, 0 for a flat position.
  static double unrealizedLossPercent(const domain::Position& position);

 private:
  mutable std::atomic<std::uint64_t> evaluations_{0};
};

}  // namespace tradeguard
