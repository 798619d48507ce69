#include "tradeguard/execution/order_lifecycle_engine.hpp"
#include "tradeguard/domain/to_string.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Constructor / destructor: attach and detach the venue fill channel
// -----------------------------------------------------------------------------
OrderLifecycleEngine::OrderLifecycleEngine(EventBus& bus, IVenueAdapter& venue,
                                           PositionLedger& ledger,
                                           AlertLog& alerts,
                                           const ITimeProvider& clock,
                                           RetryPolicy retry,
                                           std::chrono::milliseconds venue_timeout)
    : bus_(bus),
      venue_(venue),
      ledger_(ledger),
      alerts_(alerts),
      clock_(clock),
      retry_(retry),
      venue_timeout_(venue_timeout) {
  venue_.setFillSink(
      [this](const domain::Fill& fill) { onVenueFill(fill); });
}

OrderLifecycleEngine::~OrderLifecycleEngine() {
  shutdown();
  venue_.setFillSink(nullptr);
}

// -----------------------------------------------------------------------------
// transitionStatus: validate state machine transitions
// -----------------------------------------------------------------------------
bool OrderLifecycleEngine::transitionStatus(domain::SliceStatus current,
                                            domain::SliceStatus next) {
  using S = domain::SliceStatus;

  switch (current) {
    case S::Created:
      return next == S::Submitted ||
             next == S::Rejected ||
             next == S::Failed;

    case S::Submitted:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled ||
             next == S::Failed;

    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled ||
             next == S::Failed;

    case S::Filled:
    case S::Canceled:
    case S::Rejected:
    case S::Failed:
      return false;
  }

  return false;
}

bool OrderLifecycleEngine::transitionLocked(domain::ChildOrderSlice& slice,
                                            domain::SliceStatus next,
                                            std::vector<SliceUpdateEvent>& out) {
  domain::SliceStatus previous = slice.status;
  if (!transitionStatus(previous, next)) {
    std::cerr << "[OrderLifecycle] WARNING: illegal transition for slice_id="
              << slice.id << " from " << domain::toString(previous) << " to "
              << domain::toString(next) << ". Skipping.\n";
    return false;
  }

  domain::Quantity before = workingContribution(slice);
  slice.status = next;
  outstanding_[slice.instrument] += workingContribution(slice) - before;

  SliceUpdateEvent update;
  update.slice = slice;
  update.previous_status = previous;
  update.timestamp = clock_.now();
  update.sequence_id = ++sequence_;
  out.push_back(std::move(update));
  return true;
}

void OrderLifecycleEngine::publishAll(
    const std::vector<SliceUpdateEvent>& events) {
  for (const auto& e : events) {
    bus_.publish(e);
  }
}

domain::Quantity OrderLifecycleEngine::workingContribution(
    const domain::ChildOrderSlice& s) {
  if (domain::isTerminal(s.status)) {
    return 0;
  }
  return domain::signedQuantity(s.side, s.remaining());
}

// -----------------------------------------------------------------------------
// registerSlice: ledger first, then the local book
// -----------------------------------------------------------------------------
bool OrderLifecycleEngine::registerSlice(domain::ChildOrderSlice slice) {
  if (stopping_.load()) {
    return false;
  }

  slice.status = domain::SliceStatus::Created;
  slice.filled_quantity = 0;
  slice.submit_attempts = 0;
  slice.venue_order_id.clear();

  // A fill may arrive before venue.submit() returns.
  ledger_.registerSlice(slice);

  SliceUpdateEvent created;
  created.slice = slice;
  created.previous_status = domain::SliceStatus::Created;
  created.timestamp = clock_.now();
  {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = slices_.try_emplace(slice.id, slice);
    if (!inserted) {
      std::cerr << "[OrderLifecycle] WARNING: slice_id=" << slice.id
                << " registered twice. Keeping the first.\n";
      return true;
    }
    outstanding_[slice.instrument] += workingContribution(slice);
    parent_slices_[slice.parent_id].push_back(slice.id);
    created.sequence_id = ++sequence_;
  }
  bus_.publish(created);
  return true;
}

// -----------------------------------------------------------------------------
// submit: register, then attempt / back off / retry
// -----------------------------------------------------------------------------
SubmitOutcome OrderLifecycleEngine::submit(domain::ChildOrderSlice slice) {
  const domain::SliceId id = slice.id;
  if (!registerSlice(std::move(slice))) {
    SubmitOutcome outcome;
    outcome.status = domain::SliceStatus::Failed;
    outcome.error = domain::ErrorCode::NotRunning;
    outcome.reason = "lifecycle engine is shutting down";
    return outcome;
  }
  return submitRegistered(id);
}

SubmitOutcome OrderLifecycleEngine::submitRegistered(domain::SliceId id) {
  SubmitOutcome outcome;

  {
    std::lock_guard lock(mutex_);
    if (slices_.find(id) == slices_.end()) {
      outcome.status = domain::SliceStatus::Failed;
      outcome.error = domain::ErrorCode::NotRunning;
      outcome.reason = "slice " + std::to_string(id) + " was never registered";
      return outcome;
    }
  }

  std::string last_reason;
  domain::ErrorCode last_error = domain::ErrorCode::VenueTransient;

  for (int attempt = 1; attempt <= retry_.max_attempts; ++attempt) {
    if (stopping_.load()) {
      last_reason = "lifecycle engine is shutting down";
      last_error = domain::ErrorCode::NotRunning;
      break;
    }

    domain::ChildOrderSlice request;
    {
      std::lock_guard lock(mutex_);
      domain::ChildOrderSlice& stored = slices_[id];
      stored.submit_attempts = attempt;
      request = stored;
    }
    outcome.attempts = attempt;

    VenueResponse response = venue_.submit(request, venue_timeout_);

    if (response.status == VenueResponse::Status::Accepted) {
      std::vector<SliceUpdateEvent> events;
      {
        std::lock_guard lock(mutex_);
        domain::ChildOrderSlice& stored = slices_[id];
        stored.venue_order_id = response.venue_order_id;
        venue_index_[response.venue_order_id] = id;
        // A fill may already have acknowledged the slice implicitly.
        if (stored.status == domain::SliceStatus::Created) {
          transitionLocked(stored, domain::SliceStatus::Submitted, events);
        }
        outcome.status = stored.status;
      }
      terminal_cv_.notify_all();
      publishAll(events);

      // The only way to Failed before the ack is a refused early fill.
      if (outcome.status == domain::SliceStatus::Failed) {
        outcome.error = domain::ErrorCode::LedgerInconsistency;
        outcome.reason = "ledger refused a fill delivered before the venue "
                         "acknowledged the slice";
      }
      return outcome;
    }

    if (response.status == VenueResponse::Status::Rejected) {
      std::cerr << "[OrderLifecycle] slice_id=" << id
                << " rejected by venue: " << response.reason << "\n";
      std::vector<SliceUpdateEvent> events;
      {
        std::lock_guard lock(mutex_);
        domain::ChildOrderSlice& stored = slices_[id];
        transitionLocked(stored, domain::SliceStatus::Rejected, events);
        outcome.status = stored.status;
      }
      terminal_cv_.notify_all();
      publishAll(events);
      outcome.error = domain::ErrorCode::VenueRejected;
      outcome.reason = response.reason;
      return outcome;
    }

    last_reason = response.reason;
    std::cerr << "[OrderLifecycle] slice_id=" << id << " attempt " << attempt
              << "/" << retry_.max_attempts
              << " transient error: " << response.reason << "\n";

    if (attempt < retry_.max_attempts &&
        !waitBackoff(retry_.backoffAfter(attempt))) {
      last_reason = "shutdown during backoff";
      break;
    }
  }

  std::vector<SliceUpdateEvent> events;
  {
    std::lock_guard lock(mutex_);
    domain::ChildOrderSlice& stored = slices_[id];
    transitionLocked(stored, domain::SliceStatus::Failed, events);
    outcome.status = stored.status;
  }
  terminal_cv_.notify_all();
  publishAll(events);

  outcome.error = last_error;
  outcome.reason = last_error == domain::ErrorCode::NotRunning
                       ? last_reason
                       : "retries exhausted: " + last_reason;
  return outcome;
}

bool OrderLifecycleEngine::waitBackoff(std::chrono::milliseconds delay) {
  std::unique_lock lock(backoff_mutex_);
  backoff_cv_.wait_for(lock, delay, [this] { return stopping_.load(); });
  return !stopping_.load();
}

void OrderLifecycleEngine::shutdown() {
  {
    std::lock_guard lock(backoff_mutex_);
    stopping_.store(true);
  }
  backoff_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// onVenueFill: ledger first, then the slice state
// -----------------------------------------------------------------------------
void OrderLifecycleEngine::onVenueFill(const domain::Fill& fill) {
  domain::Fill routed = fill;
  {
    std::lock_guard lock(mutex_);
    if (slices_.find(routed.slice_id) == slices_.end()) {
      auto it = venue_index_.find(fill.venue_order_id);
      if (it == venue_index_.end()) {
        std::cerr << "[OrderLifecycle] WARNING: fill " << fill.fill_id
                  << " for unknown slice_id=" << fill.slice_id
                  << " venue_order_id=" << fill.venue_order_id
                  << ". Skipping.\n";
        return;
      }
      routed.slice_id = it->second;
    }
  }

  LedgerResult result = ledger_.applyFill(routed);

  if (result.outcome == LedgerOutcome::Duplicate) {
    return;
  }

  std::vector<SliceUpdateEvent> events;
  std::vector<domain::SliceId> pruned;

  if (result.outcome == LedgerOutcome::Inconsistent) {
    {
      std::lock_guard lock(mutex_);
      auto it = slices_.find(routed.slice_id);
      if (it != slices_.end() && !domain::isTerminal(it->second.status)) {
        domain::ChildOrderSlice& stored = it->second;
        if (stored.status == domain::SliceStatus::Created) {
          transitionLocked(stored, domain::SliceStatus::Submitted, events);
        }
        transitionLocked(stored, domain::SliceStatus::Failed, events);
        pruned = pruneReleasedLocked();
      }
    }
    terminal_cv_.notify_all();
    publishAll(events);
    ledger_.releaseSlices(pruned);
    alerts_.raise(domain::AlertSeverity::Critical, "ledger_inconsistency",
                  "fill " + routed.fill_id + " on slice " +
                      std::to_string(routed.slice_id) + " refused: " +
                      result.reason,
                  static_cast<double>(routed.quantity));
    return;
  }

  {
    std::lock_guard lock(mutex_);
    auto it = slices_.find(routed.slice_id);
    if (it == slices_.end()) {
      // Released between the routing lookup and the ledger; already booked.
      std::cerr << "[OrderLifecycle] fill " << routed.fill_id
                << " booked for released slice_id=" << routed.slice_id
                << ".\n";
      return;
    }
    domain::ChildOrderSlice& stored = it->second;
    domain::Quantity before = workingContribution(stored);
    stored.filled_quantity += routed.quantity;
    outstanding_[stored.instrument] += workingContribution(stored) - before;
    parent_filled_[stored.parent_id] += routed.quantity;

    if (domain::isTerminal(stored.status)) {
      std::cerr << "[OrderLifecycle] late fill " << routed.fill_id
                << " on " << domain::toString(stored.status)
                << " slice_id=" << stored.id << " booked, status kept.\n";
    } else {
      if (stored.status == domain::SliceStatus::Created) {
        transitionLocked(stored, domain::SliceStatus::Submitted, events);
      }
      domain::SliceStatus next = stored.filled_quantity >= stored.quantity
                                     ? domain::SliceStatus::Filled
                                     : domain::SliceStatus::PartiallyFilled;
      transitionLocked(stored, next, events);
      if (next == domain::SliceStatus::Filled) {
        pruned = pruneReleasedLocked();
      }
    }
  }
  terminal_cv_.notify_all();
  publishAll(events);
  ledger_.releaseSlices(pruned);
}

// -----------------------------------------------------------------------------
// awaitTerminal / cancelSlice
// -----------------------------------------------------------------------------
std::optional<domain::ChildOrderSlice> OrderLifecycleEngine::awaitTerminal(
    domain::SliceId slice_id, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  terminal_cv_.wait_for(lock, timeout, [this, slice_id] {
    auto it = slices_.find(slice_id);
    return it == slices_.end() || domain::isTerminal(it->second.status);
  });

  auto it = slices_.find(slice_id);
  if (it == slices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool OrderLifecycleEngine::cancelSlice(domain::SliceId slice_id) {
  std::string venue_order_id;
  {
    std::lock_guard lock(mutex_);
    auto it = slices_.find(slice_id);
    if (it == slices_.end() || domain::isTerminal(it->second.status) ||
        it->second.venue_order_id.empty()) {
      return false;
    }
    venue_order_id = it->second.venue_order_id;
  }

  if (!venue_.cancel(venue_order_id)) {
    std::cerr << "[OrderLifecycle] cancel not acknowledged for slice_id="
              << slice_id << " venue_order_id=" << venue_order_id << "\n";
    return false;
  }

  std::vector<SliceUpdateEvent> events;
  std::vector<domain::SliceId> pruned;
  bool canceled = false;
  {
    std::lock_guard lock(mutex_);
    auto it = slices_.find(slice_id);
    // It may have filled while the cancel was in flight.
    if (it != slices_.end() && !domain::isTerminal(it->second.status)) {
      canceled =
          transitionLocked(it->second, domain::SliceStatus::Canceled, events);
      pruned = pruneReleasedLocked();
    }
  }
  terminal_cv_.notify_all();
  publishAll(events);
  ledger_.releaseSlices(pruned);
  return canceled;
}

// -----------------------------------------------------------------------------
// releaseParent / pruneReleasedLocked
// -----------------------------------------------------------------------------
void OrderLifecycleEngine::releaseParent(domain::OrderId parent) {
  std::vector<domain::SliceId> pruned;
  {
    std::lock_guard lock(mutex_);
    if (parent_slices_.find(parent) == parent_slices_.end()) {
      return;
    }
    released_.insert(parent);
    pruned = pruneReleasedLocked();
  }
  ledger_.releaseSlices(pruned);
}

std::vector<domain::SliceId> OrderLifecycleEngine::pruneReleasedLocked() {
  std::vector<domain::SliceId> pruned;
  for (auto parent_it = released_.begin(); parent_it != released_.end();) {
    auto index_it = parent_slices_.find(*parent_it);
    if (index_it != parent_slices_.end()) {
      auto& ids = index_it->second;
      for (auto id_it = ids.begin(); id_it != ids.end();) {
        auto slice_it = slices_.find(*id_it);
        if (slice_it != slices_.end() &&
            !domain::isTerminal(slice_it->second.status)) {
          ++id_it;
          continue;
        }
        if (slice_it != slices_.end()) {
          venue_index_.erase(slice_it->second.venue_order_id);
          slices_.erase(slice_it);
        }
        pruned.push_back(*id_it);
        id_it = ids.erase(id_it);
      }
      if (!ids.empty()) {
        ++parent_it;
        continue;
      }
      parent_slices_.erase(index_it);
    }
    parent_filled_.erase(*parent_it);
    parent_it = released_.erase(parent_it);
  }
  return pruned;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::ChildOrderSlice> OrderLifecycleEngine::slice(
    domain::SliceId slice_id) const {
  std::lock_guard lock(mutex_);
  auto it = slices_.find(slice_id);
  if (it == slices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::ChildOrderSlice> OrderLifecycleEngine::slicesFor(
    domain::OrderId parent) const {
  std::vector<domain::ChildOrderSlice> out;
  {
    std::lock_guard lock(mutex_);
    auto index_it = parent_slices_.find(parent);
    if (index_it == parent_slices_.end()) {
      return out;
    }
    for (domain::SliceId id : index_it->second) {
      auto it = slices_.find(id);
      if (it != slices_.end()) {
        out.push_back(it->second);
      }
    }
  }
  std::sort(out.begin(), out.end(),
            [](const domain::ChildOrderSlice& a,
               const domain::ChildOrderSlice& b) { return a.index < b.index; });
  return out;
}

domain::Quantity OrderLifecycleEngine::outstandingQuantity(
    const std::string& instrument) const {
  std::lock_guard lock(mutex_);
  auto it = outstanding_.find(instrument);
  return it == outstanding_.end() ? 0 : it->second;
}

std::optional<domain::Quantity> OrderLifecycleEngine::filledQuantity(
    domain::OrderId parent) const {
  std::lock_guard lock(mutex_);
  if (parent_slices_.find(parent) == parent_slices_.end()) {
    return std::nullopt;
  }
  auto it = parent_filled_.find(parent);
  return it == parent_filled_.end() ? 0 : it->second;
}

std::size_t OrderLifecycleEngine::trackedSliceCount() const {
  std::lock_guard lock(mutex_);
  return slices_.size();
}

}  // namespace tradeguard
