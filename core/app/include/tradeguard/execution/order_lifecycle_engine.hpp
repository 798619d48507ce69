#pragma once

#include "tradeguard/domain/child_order_slice.hpp"
#include "tradeguard/domain/error_code.hpp"
#include "tradeguard/domain/fill.hpp"
#include "tradeguard/domain/order_status.hpp"
#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/events/slice_update_event.hpp"
#include "tradeguard/execution/i_venue_adapter.hpp"
#include "tradeguard/execution/retry_policy.hpp"
#include "tradeguard/risk/alert_log.hpp"
#include "tradeguard/risk/position_ledger.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tradeguard {

// Result of OrderLifecycleEngine::submit().
struct SubmitOutcome {
  domain::SliceStatus status{domain::SliceStatus::Created};
  domain::ErrorCode error{domain::ErrorCode::None};
  std::string reason;
  int attempts{0};

  // The venue acknowledged the slice (it may already be filled).
  bool accepted() const {
    return status == domain::SliceStatus::Submitted ||
           status == domain::SliceStatus::PartiallyFilled ||
           status == domain::SliceStatus::Filled;
  }
};

// -----------------------------------------------------------------------------
// OrderLifecycleEngine — child order state machine and venue submission
// -----------------------------------------------------------------------------
//
// @brief  Submits slices to the IVenueAdapter, retries transient errors
//         with bounded backoff, tracks every slice through its state
//         machine, and forwards fills to the PositionLedger.
//
// @details
// Slice state machine (see transitionStatus()):
//
//   Created ──accept──▶ Submitted ──fill──▶ PartiallyFilled ──fill──▶ Filled
//      │                   │                      │
//      ├──reject──▶ Rejected                      ├──cancel──▶ Canceled
//      └──retries exhausted──▶ Failed             └──ledger refusal──▶ Failed
//
// Illegal transitions are logged and skipped; the slice keeps its state.
//
// Submission (submit(), called from a ParentOrderTask thread):
//   1. Register the slice locally and with the ledger, publish Created.
//      registerSlice() may be called on its own first so the slice counts
//      towards outstandingQuantity() before it reaches the venue.
//   2. Call venue.submit() with the venue timeout.
//        Accepted       → Submitted, return. If a fill delivered during the
//                         call was refused by the ledger the slice is
//                         already Failed and the outcome carries
//                         LedgerInconsistency.
//        Rejected       → Rejected (VenueRejected), return. No retry.
//        TransientError → wait backoffAfter(attempt), try again, up to
//                         RetryPolicy::max_attempts; then Failed
//                         (VenueTransient).
//
// Fills (onVenueFill(), called on the venue's fill thread):
//   The fill is applied to the ledger synchronously, before the slice state
//   advances. Applied → PartiallyFilled / Filled. Duplicate → ignored.
//   Inconsistent → slice Failed (LedgerInconsistency) and a Critical alert.
//   A fill that beats the venue's acknowledgment moves Created to Submitted
//   first. Fills are routed by slice id, falling back to the venue order id.
//
// Every transition publishes a SliceUpdateEvent, outside the lock.
//
// Bookkeeping:
//   outstanding_ holds the signed unfilled quantity of the working slices
//   per instrument and is adjusted on every transition and fill, so
//   outstandingQuantity() does not depend on session length. parent_slices_
//   and parent_filled_ index slices by parent. releaseParent() forgets a
//   parent's terminal slices here and in the ledger once nobody reports on
//   it any more; a later fill for one of them is dropped as unknown.
//
// Thread model:
//   Many parent tasks submit concurrently while fills arrive on another
//   thread. All maps are guarded by mutex_; terminal_cv_ wakes
//   awaitTerminal() callers. The venue and the ledger are never called with
//   mutex_ held.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. References the venue,
//   ledger, alert log, bus and clock, all owned by TradingEngine (or the
//   test). Installs itself as the venue's fill sink in the constructor and
//   detaches in the destructor.
// -----------------------------------------------------------------------------
class OrderLifecycleEngine {
 public:
  OrderLifecycleEngine(EventBus& bus, IVenueAdapter& venue,
                       PositionLedger& ledger, AlertLog& alerts,
                       const ITimeProvider& clock, RetryPolicy retry,
                       std::chrono::milliseconds venue_timeout);

  ~OrderLifecycleEngine();

  OrderLifecycleEngine(const OrderLifecycleEngine&) = delete;
  OrderLifecycleEngine& operator=(const OrderLifecycleEngine&) = delete;
  OrderLifecycleEngine(OrderLifecycleEngine&&) = delete;
  OrderLifecycleEngine& operator=(OrderLifecycleEngine&&) = delete;

  // -------------------------------------------------------------------------
  // submit(slice)
  // -------------------------------------------------------------------------
  // @brief  Takes ownership of the slice and drives it to Submitted,
  //         Rejected or Failed.
  //
  // @details
  // Blocks for at most max_attempts * venue_timeout plus the backoff waits.
  // Returns early with Failed if shutdown() is called during a backoff.
  // -------------------------------------------------------------------------
  SubmitOutcome submit(domain::ChildOrderSlice slice);

  // Records the slice as Created, with the ledger and locally, and
  // publishes Created. The slice counts as outstanding from here on.
  // false (nothing recorded) once shutdown() has been called.
  bool registerSlice(domain::ChildOrderSlice slice);

  // Venue half of submit() for a slice already registered.
  SubmitOutcome submitRegistered(domain::SliceId slice_id);

  // Fill channel entry point; installed as the venue's FillSink.
  void onVenueFill(const domain::Fill& fill);

  // -------------------------------------------------------------------------
  // awaitTerminal(slice_id, timeout)
  // -------------------------------------------------------------------------
  // @return A copy of the slice once it is terminal, or its current state
  //         when the timeout expires (check isTerminal() on the result).
  //         std::nullopt for an unknown id.
  // -------------------------------------------------------------------------
  std::optional<domain::ChildOrderSlice> awaitTerminal(
      domain::SliceId slice_id, std::chrono::milliseconds timeout);

  // Asks the venue to cancel a working slice. true if the venue acked and
  // the slice moved to Canceled.
  bool cancelSlice(domain::SliceId slice_id);

  std::optional<domain::ChildOrderSlice> slice(domain::SliceId slice_id) const;
  std::vector<domain::ChildOrderSlice> slicesFor(domain::OrderId parent) const;

  // Signed quantity still working at the venue (non-terminal slices,
  // unfilled part) for the instrument.
  domain::Quantity outstandingQuantity(const std::string& instrument) const;

  // Quantity booked across every slice of the parent, late fills included.
  // std::nullopt when no slice of the parent is known.
  std::optional<domain::Quantity> filledQuantity(domain::OrderId parent) const;

  // Forgets the parent's terminal slices. Slices still working stay until
  // they settle and are dropped by a later call.
  void releaseParent(domain::OrderId parent);

  // Slices currently held (working and retained history).
  std::size_t trackedSliceCount() const;

  // Aborts pending backoff waits. Further submits fail immediately.
  void shutdown();

  // -------------------------------------------------------------------------
  // transitionStatus(current, next)
  // -------------------------------------------------------------------------
  // Pure check of the slice state machine graph. PartiallyFilled →
  // PartiallyFilled is legal (another partial fill).
  // -------------------------------------------------------------------------
  static bool transitionStatus(domain::SliceStatus current,
                               domain::SliceStatus next);

 private:
  // Applies a legal transition to the stored slice and appends the event to
  // publish. Returns false (and logs) for an illegal one. Caller holds mutex_.
  bool transitionLocked(domain::ChildOrderSlice& slice,
                        domain::SliceStatus next,
                        std::vector<SliceUpdateEvent>& out);

  void publishAll(const std::vector<SliceUpdateEvent>& events);

  // Signed unfilled quantity a slice contributes to outstanding_.
  static domain::Quantity workingContribution(const domain::ChildOrderSlice& s);

  // Erases terminal slices of released parents. Caller holds mutex_;
  // returns the erased ids for the ledger.
  std::vector<domain::SliceId> pruneReleasedLocked();

  // Interruptible backoff wait; false if shutdown() was called.
  bool waitBackoff(std::chrono::milliseconds delay);

  EventBus& bus_;
  IVenueAdapter& venue_;
  PositionLedger& ledger_;
  AlertLog& alerts_;
  const ITimeProvider& clock_;
  const RetryPolicy retry_;
  const std::chrono::milliseconds venue_timeout_;

  mutable std::mutex mutex_;
  std::condition_variable terminal_cv_;
  std::unordered_map<domain::SliceId, domain::ChildOrderSlice> slices_;
  std::unordered_map<std::string, domain::SliceId> venue_index_;
  std::unordered_map<std::string, domain::Quantity> outstanding_;
  std::unordered_map<domain::OrderId, std::vector<domain::SliceId>>
      parent_slices_;
  std::unordered_map<domain::OrderId, domain::Quantity> parent_filled_;
  std::unordered_set<domain::OrderId> released_;
  std::uint64_t sequence_{0};

  std::atomic<bool> stopping_{false};
  std::mutex backoff_mutex_;
  std::condition_variable backoff_cv_;
};

}  // namespace tradeguard
