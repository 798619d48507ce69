#pragma once

#include "tradeguard/domain/order_intent.hpp"
#include "tradeguard/domain/risk_decision.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// MarketDataEvent
// -----------------------------------------------------------------------------
// One tick decoded by MarketDataGateway. bid/ask fall back to last when the
// publisher sends a trade price only.
// -----------------------------------------------------------------------------
struct MarketDataEvent {
  std::string instrument;
  double bid{0.0};
  double ask{0.0};
  double last{0.0};
  double volume{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// RiskRejectEvent
// -----------------------------------------------------------------------------
// Published whenever the Risk Rule Engine refuses an order, either at intake
// (at_intake true) or before slice slice_index. Carries the full violation list.
// -----------------------------------------------------------------------------
struct RiskRejectEvent {
  domain::OrderId order_id{};
  std::string instrument;
  domain::Quantity proposed_quantity{0};
  bool at_intake{true};
  std::size_t slice_index{0};
  std::vector<domain::RuleViolation> violations;
  Timestamp timestamp{};
};

}  // namespace tradeguard
