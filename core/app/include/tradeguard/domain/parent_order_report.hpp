#pragma once

#include "tradeguard/domain/error_code.hpp"
#include "tradeguard/domain/order_intent.hpp"
#include "tradeguard/domain/order_status.hpp"
#include "tradeguard/domain/risk_decision.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// ParentOrderReport
// -----------------------------------------------------------------------------
// Execution status of one accepted parent order. Published as a
// ParentOrderUpdateEvent on every change and kept by the ExecutionScheduler
// for orderStatus() queries after the task has finished.
//
// scheduled_quantity counts slices handed to the OrderLifecycleEngine;
// filled_quantity counts fills the ledger accepted for them. halt_reason and
// violations explain a PartiallyExecuted or Failed outcome.
// -----------------------------------------------------------------------------
struct ParentOrderReport {
  OrderId order_id{};
  std::string instrument;
  Side side{Side::Buy};
  Quantity target_quantity{0};
  Quantity scheduled_quantity{0};
  Quantity filled_quantity{0};
  std::size_t slices_submitted{0};
  std::size_t slices_filled{0};
  ParentStatus status{ParentStatus::Working};
  ErrorCode halt_reason{ErrorCode::None};
  std::vector<RuleViolation> violations;
  std::string message;
  Timestamp updated_at{};
};

}  // namespace domain
}  // namespace tradeguard
