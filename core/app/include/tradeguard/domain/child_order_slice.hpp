#pragma once

#include "tradeguard/domain/order_intent.hpp"
#include "tradeguard/domain/order_status.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradeguard {
namespace domain {

using SliceId = std::uint64_t;

// -----------------------------------------------------------------------------
// ChildOrderSlice
// -----------------------------------------------------------------------------
// Responsibility: One scheduled, independently submitted portion of a parent
// order. Created by the ExecutionScheduler, owned by the OrderLifecycleEngine
// from submission onwards.
//
// Invariants: quantity > 0; 0 <= filled_quantity <= quantity.
// -----------------------------------------------------------------------------
struct ChildOrderSlice {
  SliceId id{};                   // Unique across the engine
  OrderId parent_id{};            // Owning parent order
  std::size_t index{0};           // 0-based position in the parent's sequence
  std::string instrument;
  Side side{Side::Buy};
  Quantity quantity{0};
  Quantity filled_quantity{0};
  std::optional<double> limit_price;
  Timestamp scheduled_at{};
  SliceStatus status{SliceStatus::Created};
  std::string venue_order_id;     // Empty until the venue acknowledges
  int submit_attempts{0};

  Quantity remaining() const { return quantity - filled_quantity; }
};

}  // namespace domain
}  // namespace tradeguard
