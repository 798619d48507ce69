#pragma once

#include "tradeguard/concurrent/thread_safe_queue.hpp"
#include "tradeguard/domain/fill.hpp"
#include "tradeguard/execution/i_venue_adapter.hpp"
#include "tradeguard/market/i_market_data_source.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace tradeguard {

// -----------------------------------------------------------------------------
// SimulatedVenue — deterministic in-process venue
// -----------------------------------------------------------------------------
//
// @brief  IVenueAdapter used by the engine executable in paper mode and by
//         the tests. Acknowledges submissions synchronously and delivers
//         fills asynchronously on its own thread.
//
// @details
// Fill model:
//   Immediate  one fill for the whole slice (the default).
//   Partial    one fill for half the slice (at least 1 unit); the rest stays
//              working until canceled.
//   None       acknowledge only, never fill.
//
//   Fill price: the slice's limit price, else the instrument's last trade
//   (then mid) from the market data source, else default_price.
//
// Scripting (tests): setIndexOutcome() forces every submission of the slice
// at a given index within its parent to return TransientError or Rejected.
// failNextSubmissions(n) makes the next n submissions transient, whatever
// slice they belong to. Every submission attempt is counted.
//
// Thread model:
//   submit() and cancel() may be called from many parent task threads;
//   venue state is guarded by mutex_. Fills are queued and handed to the
//   sink from the fill thread, never from the caller's thread, so a sink
//   may take its own locks freely.
//
// Ownership:
//   Starts the fill thread in the constructor, joins it in the destructor.
//   The market data source and clock are borrowed.
// -----------------------------------------------------------------------------
class SimulatedVenue final : public IVenueAdapter {
 public:
  enum class FillMode {
    Immediate,
    Partial,
    None,
  };

  SimulatedVenue(const ITimeProvider& clock,
                 const IMarketDataSource* market = nullptr,
                 double default_price = 100.0);

  ~SimulatedVenue() override;

  SimulatedVenue(const SimulatedVenue&) = delete;
  SimulatedVenue& operator=(const SimulatedVenue&) = delete;
  SimulatedVenue(SimulatedVenue&&) = delete;
  SimulatedVenue& operator=(SimulatedVenue&&) = delete;

  VenueResponse submit(const domain::ChildOrderSlice& slice,
                       std::chrono::milliseconds timeout) override;

  bool cancel(const std::string& venue_order_id) override;

  void setFillSink(FillSink sink) override;

  // --- Scripting -------------------------------------------------------------
  void setFillMode(FillMode mode);
  void setIndexOutcome(std::size_t slice_index, VenueResponse::Status status);
  void failNextSubmissions(int count);

  // Queues an arbitrary fill for delivery, e.g. a redelivered duplicate.
  void injectFill(domain::Fill fill);

  // --- Counters --------------------------------------------------------------
  std::size_t submissionCount() const;
  std::size_t submissionsForIndex(std::size_t slice_index) const;
  std::size_t acceptedCount() const;

 private:
  struct WorkingOrder {
    domain::SliceId slice_id{};
    domain::Quantity quantity{0};
    domain::Quantity filled{0};
    bool canceled{false};
  };

  void run();
  double priceFor(const domain::ChildOrderSlice& slice) const;

  const ITimeProvider& clock_;
  const IMarketDataSource* market_;
  const double default_price_;

  mutable std::mutex mutex_;
  FillMode fill_mode_{FillMode::Immediate};
  std::map<std::size_t, VenueResponse::Status> index_outcomes_;
  int fail_next_{0};
  std::size_t submissions_{0};
  std::size_t accepted_{0};
  std::unordered_map<std::size_t, std::size_t> submissions_by_index_;
  std::unordered_map<std::string, WorkingOrder> orders_;
  std::uint64_t next_order_{1};

  std::mutex sink_mutex_;
  FillSink sink_;

  ThreadSafeQueue<domain::Fill> fills_;
  std::atomic<bool> running_{true};
  std::thread thread_;
};

}  // namespace tradeguard
