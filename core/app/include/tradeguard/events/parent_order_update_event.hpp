#pragma once

#include "tradeguard/domain/parent_order_report.hpp"

namespace tradeguard {

// Published by a ParentOrderTask when it starts, after each slice outcome,
// and once more on reaching a terminal status.
struct ParentOrderUpdateEvent {
  domain::ParentOrderReport report;
};

}  // namespace tradeguard
