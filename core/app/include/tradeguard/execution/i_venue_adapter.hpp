#pragma once

#include "tradeguard/domain/child_order_slice.hpp"
#include "tradeguard/domain/fill.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace tradeguard {

// Outcome of one submission attempt.
struct VenueResponse {
  enum class Status {
    Accepted,        // venue_order_id is set
    Rejected,        // Hard rejection; reason is set; never retried
    TransientError,  // Timeout, rate limit, connectivity; may be retried
  };

  Status status{Status::TransientError};
  std::string venue_order_id;
  std::string reason;

  static VenueResponse accepted(std::string venue_order_id) {
    return {Status::Accepted, std::move(venue_order_id), {}};
  }
  static VenueResponse rejected(std::string reason) {
    return {Status::Rejected, {}, std::move(reason)};
  }
  static VenueResponse transient(std::string reason) {
    return {Status::TransientError, {}, std::move(reason)};
  }
};

// -----------------------------------------------------------------------------
// IVenueAdapter — boundary to the external execution venue
// -----------------------------------------------------------------------------
//
// @brief  Narrow interface the OrderLifecycleEngine talks to. Real broker
//         adapters live outside this repository; SimulatedVenue implements
//         it for the engine executable and the tests.
//
// @details
// submit() must return within the given timeout; an adapter that cannot
// get an answer in time reports TransientError. Fills are never returned
// from submit(): they arrive later, on any thread, through the FillSink,
// carrying the slice id and the venue order id. A fill may arrive before
// submit() has returned.
//
// Thread-safety: Implementations must accept submit() and cancel() from
// several parent task threads at once.
// -----------------------------------------------------------------------------
class IVenueAdapter {
 public:
  using FillSink = std::function<void(const domain::Fill&)>;

  virtual ~IVenueAdapter() = default;

  virtual VenueResponse submit(const domain::ChildOrderSlice& slice,
                               std::chrono::milliseconds timeout) = 0;

  // true once the venue acknowledged the cancel.
  virtual bool cancel(const std::string& venue_order_id) = 0;

  // Replaces the fill channel. Passing an empty function detaches it.
  virtual void setFillSink(FillSink sink) = 0;
};

}  // namespace tradeguard
