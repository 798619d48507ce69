#pragma once

#include "tradeguard/domain/child_order_slice.hpp"
#include "tradeguard/domain/fill.hpp"
#include "tradeguard/domain/position.hpp"
#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tradeguard {

enum class LedgerOutcome {
  Applied,       // Fill booked; position carries the post-fill state
  Duplicate,     // fill_id already applied; nothing changed
  Inconsistent,  // Fill refused; nothing changed; reason explains why
};

struct LedgerResult {
  LedgerOutcome outcome{LedgerOutcome::Inconsistent};
  domain::Position position;
  std::string reason;

  bool applied() const { return outcome == LedgerOutcome::Applied; }
};

// -----------------------------------------------------------------------------
// PositionLedger — authoritative positions, cash and PnL
// -----------------------------------------------------------------------------
//
// @brief  The single writer of Position and fill history. Applies confirmed
//         fills with weighted-average-cost accounting and serves consistent
//         snapshots to the risk rules and the Risk Monitor.
//
// @details
// Internal state, all guarded by one std::shared_mutex:
//
//   1. positions_: instrument → Position.
//
//   2. slices_: slice id → {instrument, side, quantity, filled}. Fills only
//      carry a slice id, so the OrderLifecycleEngine registers every slice
//      here before submitting it. The registry is what lets the ledger
//      attribute a fill to an instrument and direction, and refuse fills
//      for unknown slices or beyond a slice's remaining quantity.
//
//   3. applied_fill_ids_: every fill_id ever booked. A redelivered fill is
//      reported as Duplicate and has no effect.
//
//   4. cash_, peak_value_, and the session baseline (realized and
//      unrealized PnL at the last resetSession()).
//
// PnL math:
//
//   Case 1: Increasing (flat, or fill in the position's direction):
//     avg = (qty * avg + fill_qty * fill_price) / (qty + fill_qty)
//
//   Case 2: Reducing without crossing zero:
//     realized += |fill_qty| * (fill_price - avg) * sign(qty)
//     avg unchanged
//
//   Case 3: Crossing zero:
//     realized += |qty| * (fill_price - avg) * sign(qty)
//     qty = residual in the new direction, avg = fill_price
//
//   Every fill also moves cash by -signed_qty * fill_price and marks the
//   instrument at the fill price.
//
// Refused fills (LedgerInconsistency): missing fill_id, non-positive
// quantity or price, unknown slice, quantity above the slice's remaining
// quantity. They are logged to std::cerr and leave the ledger untouched;
// there is never a partial update.
//
// Thread model:
//   Fills arrive from the venue's fill thread, marks from the market data
//   thread, reads from parent tasks, the Risk Monitor and the IPC thread.
//   Mutations take the unique lock, reads the shared lock, and every read
//   returns a copy: no reference to internal state ever leaves the class.
//   PositionUpdateEvent is published after the lock is released.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Holds references to the
//   core EventBus and the ITimeProvider, both owned by TradingEngine.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  bus           Core EventBus; receives PositionUpdateEvent.
  // @param  clock         Timestamp source for update events and snapshots.
  // @param  initial_cash  Opening cash balance. Also the opening peak.
  // -------------------------------------------------------------------------
  PositionLedger(EventBus& bus, const ITimeProvider& clock,
                 double initial_cash = 0.0);

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // -------------------------------------------------------------------------
  // registerSlice(slice)
  // -------------------------------------------------------------------------
  // @brief  Records a slice so later fills can be validated and attributed.
  //
  // @details
  // Called by OrderLifecycleEngine before the first submission attempt.
  // Registering the same id twice keeps the original entry (and its filled
  // quantity).
  //
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  void registerSlice(const domain::ChildOrderSlice& slice);

  // Drops settled slices from the registry. Fills for them are refused as
  // unknown afterwards; applied fill ids are kept.
  void releaseSlices(const std::vector<domain::SliceId>& slice_ids);

  // -------------------------------------------------------------------------
  // applyFill(fill)
  // -------------------------------------------------------------------------
  // @brief  Validates and books one fill.
  //
  // @return Applied with the updated position, Duplicate for a fill_id seen
  //         before, or Inconsistent with the refusal reason.
  //
  // Thread-safety: Safe from any thread; serialized with every other
  //                mutation and read.
  // Side-effects:  On Applied, publishes PositionUpdateEvent.
  // -------------------------------------------------------------------------
  LedgerResult applyFill(const domain::Fill& fill);

  // -------------------------------------------------------------------------
  // updateMark(instrument, price)
  // -------------------------------------------------------------------------
  // Revalues unrealized PnL for an open position and advances the peak
  // portfolio value. Ignored for instruments with no position and for
  // non-positive prices. Publishes nothing.
  // -------------------------------------------------------------------------
  void updateMark(const std::string& instrument, double price);

  // -------------------------------------------------------------------------
  // hydratePosition(pos) / setCash(cash)
  // -------------------------------------------------------------------------
  // Warm-up only: used by TradingEngine::start() while reconciling with the
  // external store, before any order flow. Both re-baseline the session
  // (peak and session PnL start from the hydrated state).
  // -------------------------------------------------------------------------
  void hydratePosition(const domain::Position& pos);
  void setCash(double cash);

  // -------------------------------------------------------------------------
  // resetSession()
  // -------------------------------------------------------------------------
  // Starts a new risk session: peak portfolio value becomes the current
  // value and session PnL restarts from zero. Positions and cash are kept.
  // -------------------------------------------------------------------------
  void resetSession();

  std::optional<domain::Position> position(const std::string& instrument) const;
  domain::AggregatePosition aggregate() const;

  // -------------------------------------------------------------------------
  // snapshot()
  // -------------------------------------------------------------------------
  // @brief  Copies every position and the aggregate under one shared lock.
  //
  // @details
  // The risk rules and the Risk Monitor only ever look at the ledger
  // through this call, so they never observe a half-applied fill.
  // -------------------------------------------------------------------------
  domain::LedgerSnapshot snapshot() const;

  // Number of distinct fills booked so far.
  std::size_t appliedFillCount() const;

 private:
  struct SliceInfo {
    std::string instrument;
    domain::Side side{domain::Side::Buy};
    domain::Quantity quantity{0};
    domain::Quantity filled{0};
  };

  // Core PnL math. Mutates pos in place; see the class comment.
  static void applyToPosition(domain::Position& pos,
                              domain::Quantity signed_fill_qty,
                              double fill_price);

  static void remark(domain::Position& pos, double price);

  // Callers must hold positions_mutex_.
  domain::AggregatePosition aggregateLocked() const;
  void updatePeakLocked();
  void rebaselineLocked();

  EventBus& bus_;
  const ITimeProvider& clock_;

  mutable std::shared_mutex positions_mutex_;

  std::unordered_map<std::string, domain::Position> positions_;
  std::unordered_map<domain::SliceId, SliceInfo> slices_;
  std::unordered_set<std::string> applied_fill_ids_;

  double cash_{0.0};
  double peak_value_{0.0};
  double session_realized_base_{0.0};
  double session_unrealized_base_{0.0};
};

}  // namespace tradeguard
