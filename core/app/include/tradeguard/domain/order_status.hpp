#pragma once

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// SliceStatus — lifecycle of one child order at the venue
// -----------------------------------------------------------------------------
// Legal transitions are enforced by OrderLifecycleEngine::transitionStatus():
//
//   Created         → Submitted, Rejected, Failed
//   Submitted       → PartiallyFilled, Filled, Canceled, Failed
//   PartiallyFilled → PartiallyFilled, Filled, Canceled, Failed
//   Filled, Canceled, Rejected, Failed → (terminal)
// -----------------------------------------------------------------------------
enum class SliceStatus {
  Created,          // Registered locally, not yet acknowledged by the venue
  Submitted,        // Accepted by the venue, nothing filled yet
  PartiallyFilled,  // Some quantity filled, remainder working
  Filled,           // Fully filled. Terminal
  Canceled,         // Canceled at the venue. Terminal
  Rejected,         // Hard venue rejection, never retried. Terminal
  Failed,           // Retries exhausted or ledger refused a fill. Terminal
};

// -----------------------------------------------------------------------------
// ParentStatus — lifecycle of an accepted OrderIntent
// -----------------------------------------------------------------------------
enum class ParentStatus {
  Working,            // Scheduler task is emitting slices
  Filled,             // Every slice emitted and filled
  PartiallyExecuted,  // Halted by a risk rejection or a slice failure
  Canceled,           // Cooperative cancel observed at a suspension point
  Failed,             // Ledger inconsistency; scheduling aborted
};

inline bool isTerminal(SliceStatus status) {
  return status == SliceStatus::Filled ||
         status == SliceStatus::Canceled ||
         status == SliceStatus::Rejected ||
         status == SliceStatus::Failed;
}

inline bool isTerminal(ParentStatus status) {
  return status != ParentStatus::Working;
}

}  // namespace domain
}  // namespace tradeguard
