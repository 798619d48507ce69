#pragma once

#include "tradeguard/domain/order_intent.hpp"

#include <string>
#include <vector>

namespace tradeguard {
namespace domain {

// Rules evaluated by RiskRuleEngine, in evaluation order.
enum class RiskRuleId {
  MaxSize,
  MaxLoss,
  MaxDrawdown,
  StopLoss,
  TakeProfit,
};

enum class RiskAction {
  Reject,
  ForceFlatten,
  ClosePosition,  // Refuse it; the position has reached its profit target
};

// -----------------------------------------------------------------------------
// RuleViolation
// -----------------------------------------------------------------------------
// One violated rule, with the observed value and the limit it broke so the
// caller can report the full reason without re-deriving it.
// -----------------------------------------------------------------------------
struct RuleViolation {
  RiskRuleId rule{RiskRuleId::MaxSize};
  RiskAction action{RiskAction::Reject};
  double observed{0.0};
  double limit{0.0};
  std::string message;
};

// -----------------------------------------------------------------------------
// RiskDecision
// -----------------------------------------------------------------------------
// accept iff violations is empty. Every violated rule is listed; evaluation
// never stops at the first one.
// -----------------------------------------------------------------------------
struct RiskDecision {
  std::vector<RuleViolation> violations;

  bool accepted() const { return violations.empty(); }

  bool violates(RiskRuleId rule) const {
    for (const auto& v : violations) {
      if (v.rule == rule) {
        return true;
      }
    }
    return false;
  }
};

// The change in exposure a risk check is asked about.
struct ProposedDelta {
  std::string instrument;
  Quantity signed_quantity{0};
};

}  // namespace domain
}  // namespace tradeguard
