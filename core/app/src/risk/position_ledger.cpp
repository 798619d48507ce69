#include "tradeguard/risk/position_ledger.hpp"
#include "tradeguard/events/position_update_event.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace tradeguard {

namespace {

LedgerResult refuse(const domain::Fill& fill, std::string reason) {
  std::cerr << "[PositionLedger] REFUSED fill_id=" << fill.fill_id
            << " slice_id=" << fill.slice_id << " qty=" << fill.quantity
            << " price=" << fill.price << ": " << reason << "\n";
  LedgerResult result;
  result.outcome = LedgerOutcome::Inconsistent;
  result.reason = std::move(reason);
  return result;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PositionLedger::PositionLedger(EventBus& bus, const ITimeProvider& clock,
                               double initial_cash)
    : bus_(bus), clock_(clock), cash_(initial_cash), peak_value_(initial_cash) {}

// -----------------------------------------------------------------------------
// registerSlice
// -----------------------------------------------------------------------------
void PositionLedger::registerSlice(const domain::ChildOrderSlice& slice) {
  std::unique_lock lock(positions_mutex_);
  slices_.try_emplace(slice.id, SliceInfo{slice.instrument, slice.side,
                                          slice.quantity, 0});
}

void PositionLedger::releaseSlices(
    const std::vector<domain::SliceId>& slice_ids) {
  if (slice_ids.empty()) {
    return;
  }
  std::unique_lock lock(positions_mutex_);
  for (domain::SliceId id : slice_ids) {
    slices_.erase(id);
  }
}

// -----------------------------------------------------------------------------
// applyFill: validate, book, publish
// -----------------------------------------------------------------------------
LedgerResult PositionLedger::applyFill(const domain::Fill& fill) {
  PositionUpdateEvent update;
  LedgerResult result;

  {
    std::unique_lock lock(positions_mutex_);

    if (fill.fill_id.empty()) {
      return refuse(fill, "fill has no fill_id");
    }
    if (applied_fill_ids_.count(fill.fill_id) != 0) {
      std::cerr << "[PositionLedger] duplicate fill_id=" << fill.fill_id
                << " ignored.\n";
      result.outcome = LedgerOutcome::Duplicate;
      auto slice_it = slices_.find(fill.slice_id);
      if (slice_it != slices_.end()) {
        auto pos_it = positions_.find(slice_it->second.instrument);
        if (pos_it != positions_.end()) {
          result.position = pos_it->second;
        }
      }
      return result;
    }
    if (fill.quantity <= 0 || fill.price <= 0.0) {
      return refuse(fill, "non-positive quantity or price");
    }

    auto slice_it = slices_.find(fill.slice_id);
    if (slice_it == slices_.end()) {
      return refuse(fill, "unknown slice");
    }
    SliceInfo& info = slice_it->second;
    if (fill.quantity > info.quantity - info.filled) {
      return refuse(fill, "quantity exceeds remaining slice quantity (" +
                              std::to_string(info.quantity - info.filled) +
                              ")");
    }

    domain::Quantity signed_qty =
        domain::signedQuantity(info.side, fill.quantity);

    domain::Position& pos = positions_[info.instrument];
    if (pos.instrument.empty()) {
      pos.instrument = info.instrument;
    }

    applyToPosition(pos, signed_qty, fill.price);
    remark(pos, fill.price);
    cash_ -= static_cast<double>(signed_qty) * fill.price;

    info.filled += fill.quantity;
    applied_fill_ids_.insert(fill.fill_id);
    updatePeakLocked();

    result.outcome = LedgerOutcome::Applied;
    result.position = pos;

    update.position = pos;
    update.fill_id = fill.fill_id;
    update.timestamp = clock_.now();
  }

  bus_.publish(update);
  return result;
}

// -----------------------------------------------------------------------------
// updateMark
// -----------------------------------------------------------------------------
void PositionLedger::updateMark(const std::string& instrument, double price) {
  if (price <= 0.0) {
    return;
  }
  std::unique_lock lock(positions_mutex_);
  auto it = positions_.find(instrument);
  if (it == positions_.end()) {
    return;
  }
  remark(it->second, price);
  updatePeakLocked();
}

// -----------------------------------------------------------------------------
// hydratePosition / setCash: warm-up from reconciliation
// -----------------------------------------------------------------------------
void PositionLedger::hydratePosition(const domain::Position& pos) {
  std::unique_lock lock(positions_mutex_);
  domain::Position& stored = positions_[pos.instrument];
  stored = pos;
  remark(stored, stored.valuationPrice());
  rebaselineLocked();
}

void PositionLedger::setCash(double cash) {
  std::unique_lock lock(positions_mutex_);
  cash_ = cash;
  rebaselineLocked();
}

void PositionLedger::resetSession() {
  std::unique_lock lock(positions_mutex_);
  rebaselineLocked();
  std::cout << "[PositionLedger] session reset. peak=" << peak_value_ << "\n";
}

// -----------------------------------------------------------------------------
// Readers: all return copies
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionLedger::position(
    const std::string& instrument) const {
  std::shared_lock lock(positions_mutex_);
  auto it = positions_.find(instrument);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

domain::AggregatePosition PositionLedger::aggregate() const {
  std::shared_lock lock(positions_mutex_);
  return aggregateLocked();
}

domain::LedgerSnapshot PositionLedger::snapshot() const {
  std::shared_lock lock(positions_mutex_);
  domain::LedgerSnapshot snap;
  snap.positions.reserve(positions_.size());
  for (const auto& [instrument, pos] : positions_) {
    snap.positions.push_back(pos);
  }
  std::sort(snap.positions.begin(), snap.positions.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.instrument < b.instrument;
            });
  snap.aggregate = aggregateLocked();
  snap.taken_at = clock_.now();
  return snap;
}

std::size_t PositionLedger::appliedFillCount() const {
  std::shared_lock lock(positions_mutex_);
  return applied_fill_ids_.size();
}

// -----------------------------------------------------------------------------
// aggregateLocked
// -----------------------------------------------------------------------------
domain::AggregatePosition PositionLedger::aggregateLocked() const {
  domain::AggregatePosition agg;
  agg.cash = cash_;
  for (const auto& [instrument, pos] : positions_) {
    double value = pos.marketValue();
    agg.gross_exposure += std::abs(value);
    agg.net_exposure += value;
    agg.realized_pnl += pos.realized_pnl;
    agg.unrealized_pnl += pos.unrealized_pnl;
  }
  agg.portfolio_value = cash_ + agg.net_exposure;
  agg.peak_portfolio_value = std::max(peak_value_, agg.portfolio_value);
  agg.session_pnl = (agg.realized_pnl - session_realized_base_) +
                    (agg.unrealized_pnl - session_unrealized_base_);
  return agg;
}

void PositionLedger::updatePeakLocked() {
  peak_value_ = std::max(peak_value_, aggregateLocked().portfolio_value);
}

void PositionLedger::rebaselineLocked() {
  domain::AggregatePosition agg = aggregateLocked();
  peak_value_ = agg.portfolio_value;
  session_realized_base_ = agg.realized_pnl;
  session_unrealized_base_ = agg.unrealized_pnl;
}

void PositionLedger::remark(domain::Position& pos, double price) {
  pos.mark_price = price;
  pos.unrealized_pnl =
      static_cast<double>(pos.quantity) * (price - pos.average_cost);
}

// -----------------------------------------------------------------------------
// applyToPosition: weighted-average-cost accounting
// -----------------------------------------------------------------------------
void PositionLedger::applyToPosition(domain::Position& pos,
                                     domain::Quantity signed_fill_qty,
                                     double fill_price) {
  domain::Quantity current_qty = pos.quantity;

  // --- Flat: the fill opens a new position ----------------------------------
  if (current_qty == 0) {
    pos.quantity = signed_fill_qty;
    pos.average_cost = fill_price;
    return;
  }

  bool same_direction = (current_qty > 0) == (signed_fill_qty > 0);

  if (same_direction) {
    // ----- Case 1: increasing ----------------------------------------------
    domain::Quantity new_total = current_qty + signed_fill_qty;
    pos.average_cost =
        (static_cast<double>(current_qty) * pos.average_cost +
         static_cast<double>(signed_fill_qty) * fill_price) /
        static_cast<double>(new_total);
    pos.quantity = new_total;
    return;
  }

  domain::Quantity abs_current = std::llabs(current_qty);
  domain::Quantity abs_fill = std::llabs(signed_fill_qty);
  double direction_sign = current_qty > 0 ? 1.0 : -1.0;

  if (abs_fill <= abs_current) {
    // ----- Case 2: reducing, possibly to flat ------------------------------
    pos.realized_pnl += static_cast<double>(abs_fill) *
                        (fill_price - pos.average_cost) * direction_sign;
    pos.quantity = current_qty + signed_fill_qty;
    if (pos.quantity == 0) {
      pos.average_cost = 0.0;
    }
    return;
  }

  // ----- Case 3: crossing zero -----------------------------------------------
  pos.realized_pnl += static_cast<double>(abs_current) *
                      (fill_price - pos.average_cost) * direction_sign;
  domain::Quantity open_qty = abs_fill - abs_current;
  pos.quantity = signed_fill_qty > 0 ? open_qty : -open_qty;
  pos.average_cost = fill_price;
}

}  // namespace tradeguard
