#include "tradeguard/execution/simulated_venue.hpp"

#include <algorithm>
#include <iostream>

namespace tradeguard {

SimulatedVenue::SimulatedVenue(const ITimeProvider& clock,
                               const IMarketDataSource* market,
                               double default_price)
    : clock_(clock), market_(market), default_price_(default_price) {
  thread_ = std::thread(&SimulatedVenue::run, this);
}

SimulatedVenue::~SimulatedVenue() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
}

// -----------------------------------------------------------------------------
// submit: scripted outcome, else acknowledge and queue the fill
// -----------------------------------------------------------------------------
VenueResponse SimulatedVenue::submit(const domain::ChildOrderSlice& slice,
                                     std::chrono::milliseconds /*timeout*/) {
  std::lock_guard lock(mutex_);
  ++submissions_;
  ++submissions_by_index_[slice.index];

  if (fail_next_ > 0) {
    --fail_next_;
    return VenueResponse::transient("simulated timeout");
  }

  auto scripted = index_outcomes_.find(slice.index);
  if (scripted != index_outcomes_.end()) {
    if (scripted->second == VenueResponse::Status::Rejected) {
      return VenueResponse::rejected("simulated rejection");
    }
    if (scripted->second == VenueResponse::Status::TransientError) {
      return VenueResponse::transient("simulated rate limit");
    }
  }

  std::string venue_order_id = "SIM-" + std::to_string(next_order_++);
  ++accepted_;

  WorkingOrder order;
  order.slice_id = slice.id;
  order.quantity = slice.quantity;

  domain::Quantity fill_qty = 0;
  switch (fill_mode_) {
    case FillMode::Immediate:
      fill_qty = slice.quantity;
      break;
    case FillMode::Partial:
      fill_qty = std::max<domain::Quantity>(1, slice.quantity / 2);
      break;
    case FillMode::None:
      break;
  }

  if (fill_qty > 0) {
    domain::Fill fill;
    fill.fill_id = venue_order_id + "-F1";
    fill.slice_id = slice.id;
    fill.venue_order_id = venue_order_id;
    fill.quantity = fill_qty;
    fill.price = priceFor(slice);
    fill.timestamp = clock_.now();
    order.filled = fill_qty;
    fills_.push(std::move(fill));
  }

  orders_[venue_order_id] = order;
  return VenueResponse::accepted(venue_order_id);
}

bool SimulatedVenue::cancel(const std::string& venue_order_id) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(venue_order_id);
  if (it == orders_.end() || it->second.canceled ||
      it->second.filled >= it->second.quantity) {
    return false;
  }
  it->second.canceled = true;
  return true;
}

void SimulatedVenue::setFillSink(FillSink sink) {
  std::lock_guard lock(sink_mutex_);
  sink_ = std::move(sink);
}

// -----------------------------------------------------------------------------
// Scripting and counters
// -----------------------------------------------------------------------------
void SimulatedVenue::setFillMode(FillMode mode) {
  std::lock_guard lock(mutex_);
  fill_mode_ = mode;
}

void SimulatedVenue::setIndexOutcome(std::size_t slice_index,
                                     VenueResponse::Status status) {
  std::lock_guard lock(mutex_);
  index_outcomes_[slice_index] = status;
}

void SimulatedVenue::failNextSubmissions(int count) {
  std::lock_guard lock(mutex_);
  fail_next_ = count;
}

void SimulatedVenue::injectFill(domain::Fill fill) {
  fills_.push(std::move(fill));
}

std::size_t SimulatedVenue::submissionCount() const {
  std::lock_guard lock(mutex_);
  return submissions_;
}

std::size_t SimulatedVenue::submissionsForIndex(std::size_t slice_index) const {
  std::lock_guard lock(mutex_);
  auto it = submissions_by_index_.find(slice_index);
  return it == submissions_by_index_.end() ? 0 : it->second;
}

std::size_t SimulatedVenue::acceptedCount() const {
  std::lock_guard lock(mutex_);
  return accepted_;
}

double SimulatedVenue::priceFor(const domain::ChildOrderSlice& slice) const {
  if (slice.limit_price && *slice.limit_price > 0.0) {
    return *slice.limit_price;
  }
  if (market_ != nullptr) {
    auto snap = market_->snapshot(slice.instrument);
    if (snap) {
      if (snap->last > 0.0) {
        return snap->last;
      }
      if (snap->mid() > 0.0) {
        return snap->mid();
      }
    }
  }
  return default_price_;
}

// -----------------------------------------------------------------------------
// run: fill delivery thread
// -----------------------------------------------------------------------------
void SimulatedVenue::run() {
  while (running_.load()) {
    auto fill = fills_.pop_for(std::chrono::milliseconds(10));
    if (!fill) {
      continue;
    }

    std::lock_guard lock(sink_mutex_);
    if (!sink_) {
      std::cerr << "[SimulatedVenue] no fill sink attached, dropping fill "
                << fill->fill_id << "\n";
      continue;
    }
    sink_(*fill);
  }
}

}  // namespace tradeguard
