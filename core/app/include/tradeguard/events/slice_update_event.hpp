#pragma once

#include "tradeguard/domain/child_order_slice.hpp"
#include "tradeguard/domain/order_status.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// SliceUpdateEvent — notification of a child order state transition
// -----------------------------------------------------------------------------
//
// @brief  Published by OrderLifecycleEngine every time a ChildOrderSlice
//         moves through its state machine.
//
// @details
// Carries a full copy of the slice after the transition plus the status it
// left, so a subscriber can reconstruct the path without querying the
// engine. Published outside the lifecycle lock, on whichever thread drove
// the transition (a parent task thread or the venue's fill thread).
// -----------------------------------------------------------------------------
struct SliceUpdateEvent {
  domain::ChildOrderSlice slice;
  domain::SliceStatus previous_status{domain::SliceStatus::Created};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace tradeguard
