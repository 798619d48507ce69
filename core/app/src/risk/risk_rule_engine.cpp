#include "tradeguard/risk/risk_rule_engine.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace tradeguard {

// -----------------------------------------------------------------------------
// evaluate: run every rule, collect every violation
// -----------------------------------------------------------------------------
domain::RiskDecision RiskRuleEngine::evaluate(
    const domain::ProposedDelta& delta,
    const domain::LedgerSnapshot& snapshot,
    const domain::RiskLimitConfig& limits) const {
  evaluations_.fetch_add(1);

  const domain::Position position = snapshot.positionFor(delta.instrument);
  domain::RiskDecision decision;

  auto collect = [&decision](std::optional<domain::RuleViolation> v) {
    if (v) {
      decision.violations.push_back(std::move(*v));
    }
  };

  collect(checkMaxSize(position, delta.signed_quantity, limits));
  collect(checkMaxLoss(snapshot.aggregate, limits));
  collect(checkMaxDrawdown(snapshot.aggregate, limits));
  collect(checkStopLoss(position, delta.signed_quantity, limits));
  collect(checkTakeProfit(position, delta.signed_quantity, limits));

  return decision;
}

// -----------------------------------------------------------------------------
// MaxSize
// -----------------------------------------------------------------------------
std::optional<domain::RuleViolation> RiskRuleEngine::checkMaxSize(
    const domain::Position& position, domain::Quantity signed_delta,
    const domain::RiskLimitConfig& limits) {
  if (limits.max_position_size <= 0.0) {
    return std::nullopt;
  }
  double resulting =
      static_cast<double>(std::llabs(position.quantity + signed_delta));
  if (resulting <= limits.max_position_size) {
    return std::nullopt;
  }

  std::ostringstream msg;
  msg << "resulting position " << resulting << " in " << position.instrument
      << " exceeds max position size " << limits.max_position_size;
  return domain::RuleViolation{domain::RiskRuleId::MaxSize,
                               domain::RiskAction::Reject, resulting,
                               limits.max_position_size, msg.str()};
}

// -----------------------------------------------------------------------------
// MaxLoss
// -----------------------------------------------------------------------------
std::optional<domain::RuleViolation> RiskRuleEngine::checkMaxLoss(
    const domain::AggregatePosition& aggregate,
    const domain::RiskLimitConfig& limits) {
  if (limits.max_loss <= 0.0) {
    return std::nullopt;
  }
  double session_loss = -aggregate.session_pnl;
  if (session_loss <= limits.max_loss) {
    return std::nullopt;
  }

  std::ostringstream msg;
  msg << "session loss " << session_loss << " exceeds max loss "
      << limits.max_loss;
  return domain::RuleViolation{domain::RiskRuleId::MaxLoss,
                               domain::RiskAction::Reject, session_loss,
                               limits.max_loss, msg.str()};
}

// -----------------------------------------------------------------------------
// MaxDrawdown
// -----------------------------------------------------------------------------
std::optional<domain::RuleViolation> RiskRuleEngine::checkMaxDrawdown(
    const domain::AggregatePosition& aggregate,
    const domain::RiskLimitConfig& limits) {
  if (limits.max_drawdown_percent <= 0.0 ||
      aggregate.peak_portfolio_value <= 0.0) {
    return std::nullopt;
  }
  double floor_value = (1.0 - limits.max_drawdown_percent / 100.0) *
                       aggregate.peak_portfolio_value;
  if (aggregate.portfolio_value >= floor_value) {
    return std::nullopt;
  }

  double drawdown_pct =
      (aggregate.peak_portfolio_value - aggregate.portfolio_value) /
      aggregate.peak_portfolio_value * 100.0;
  std::ostringstream msg;
  msg << "portfolio value " << aggregate.portfolio_value << " is "
      << drawdown_pct << "% below peak " << aggregate.peak_portfolio_value
      << " (limit " << limits.max_drawdown_percent << "%)";
  return domain::RuleViolation{domain::RiskRuleId::MaxDrawdown,
                               domain::RiskAction::Reject, drawdown_pct,
                               limits.max_drawdown_percent, msg.str()};
}

// -----------------------------------------------------------------------------
// StopLoss
// -----------------------------------------------------------------------------
std::optional<domain::RuleViolation> RiskRuleEngine::checkStopLoss(
    const domain::Position& position, domain::Quantity signed_delta,
    const domain::RiskLimitConfig& limits) {
  if (limits.stop_loss_percent <= 0.0 || position.quantity == 0) {
    return std::nullopt;
  }

  bool increases_exposure = std::llabs(position.quantity + signed_delta) >
                            std::llabs(position.quantity);
  if (!increases_exposure) {
    return std::nullopt;
  }

  double loss_pct = unrealizedLossPercent(position);
  if (loss_pct <= limits.stop_loss_percent) {
    return std::nullopt;
  }

  domain::RiskAction action =
      limits.stop_loss_action == domain::StopLossAction::ForceFlatten
          ? domain::RiskAction::ForceFlatten
          : domain::RiskAction::Reject;

  std::ostringstream msg;
  msg << position.instrument << " unrealized loss " << loss_pct
      << "% exceeds stop loss " << limits.stop_loss_percent << "%";
  return domain::RuleViolation{domain::RiskRuleId::StopLoss, action, loss_pct,
                               limits.stop_loss_percent, msg.str()};
}

// -----------------------------------------------------------------------------
// TakeProfit
// -----------------------------------------------------------------------------
std::optional<domain::RuleViolation> RiskRuleEngine::checkTakeProfit(
    const domain::Position& position, domain::Quantity signed_delta,
    const domain::RiskLimitConfig& limits) {
  if (limits.take_profit_percent <= 0.0 || position.quantity == 0) {
    return std::nullopt;
  }
  if (std::llabs(position.quantity + signed_delta) <=
      std::llabs(position.quantity)) {
    return std::nullopt;
  }

  double gain_pct = -unrealizedLossPercent(position);
  if (gain_pct < limits.take_profit_percent) {
    return std::nullopt;
  }

  std::ostringstream msg;
  msg << position.instrument << " unrealized gain " << gain_pct
      << "% reached take profit " << limits.take_profit_percent
      << "%; close the position instead of adding to it";
  return domain::RuleViolation{domain::RiskRuleId::TakeProfit,
                               domain::RiskAction::ClosePosition, gain_pct,
                               limits.take_profit_percent, msg.str()};
}

double RiskRuleEngine::unrealizedLossPercent(const domain::Position& position) {
  if (position.quantity == 0 || position.average_cost <= 0.0) {
    return 0.0;
  }
  double cost_basis =
      std::abs(static_cast<double>(position.quantity) * position.average_cost);
  return -position.unrealized_pnl / cost_basis * 100.0;
}

}  // namespace tradeguard
