#pragma once

#include "tradeguard/concurrent/id_generator.hpp"
#include "tradeguard/domain/error_code.hpp"
#include "tradeguard/domain/order_intent.hpp"
#include "tradeguard/domain/parent_order_report.hpp"
#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/execution/order_lifecycle_engine.hpp"
#include "tradeguard/market/i_market_data_source.hpp"
#include "tradeguard/risk/position_ledger.hpp"
#include "tradeguard/risk/risk_config_store.hpp"
#include "tradeguard/risk/risk_rule_engine.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tradeguard {

// Collaborators shared by every ParentOrderTask of one ExecutionScheduler.
// Built once by the scheduler; never modified while tasks are running.
struct SchedulerContext {
  using HaltHandler =
      std::function<void(domain::ErrorCode, const std::string&)>;

  EventBus& bus;
  OrderLifecycleEngine& lifecycle;
  PositionLedger& ledger;
  const RiskRuleEngine& rules;
  const RiskConfigStore& config;
  const IMarketDataSource* market;
  IdGenerator& slice_ids;
  const ITimeProvider& clock;
  std::chrono::milliseconds fill_timeout;
  std::mutex& admission;               // Serializes risk check + registration
  HaltHandler on_halt;                 // Fill timeout escalation; may be empty
  std::function<void()> on_finished;   // Wakes ExecutionScheduler waiters
};

// -----------------------------------------------------------------------------
// ParentOrderTask — one running parent order
// -----------------------------------------------------------------------------
//
// @brief  Drives a single SliceSequence on its own thread: wait, size, risk
//         check, submit, wait for the slice outcome, repeat.
//
// @details
// Per slice:
//
//   1. Sleep pendingDelay() on a condition variable. requestCancel() wakes
//      the sleep; a cancel seen here ends the parent as Canceled.
//   2. Size the slice from a fresh market snapshot (MinSlippage spread,
//      Participation traded volume).
//   3. Under the scheduler's admission lock, evaluate the risk rules on the
//      cumulative delta: this slice plus the signed quantity still working
//      at the venue for the instrument, against one ledger snapshot and one
//      config pointer. A slice that passes is registered with the
//      OrderLifecycleEngine before the lock is released, so it is already
//      outstanding when the next parent checks. Rejection publishes a
//      RiskRejectEvent and ends the parent PartiallyExecuted. Every slice
//      that reaches the venue has passed exactly one evaluation.
//   4. Submit the registered slice. Rejected or Failed ends the parent
//      PartiallyExecuted, except a ledger refusal (LedgerInconsistency),
//      which ends it Failed.
//   5. Wait up to fill_timeout for the slice to turn terminal. On timeout
//      the slice is canceled at the venue, the halt handler is invoked and
//      the parent ends PartiallyExecuted with FillTimeout. A fill that
//      still arrives for the canceled slice is booked, and the scheduler's
//      report picks it up.
//
// A slice refused by the ledger ends the parent as Failed. When the
// sequence is exhausted the parent is Filled if the filled quantity equals
// the target, otherwise PartiallyExecuted.
//
// Every change to the report is published as a ParentOrderUpdateEvent.
//
// Thread model:
//   run() owns the SliceSequence. report() and requestCancel() are called
//   from other threads; the report is guarded by report_mutex_.
//
// Ownership:
//   Owned by ExecutionScheduler via std::unique_ptr. The destructor joins
//   the thread; the owner requests cancel or abort first.
// -----------------------------------------------------------------------------
class ParentOrderTask {
 public:
  ParentOrderTask(const SchedulerContext& ctx, domain::OrderId id,
                  domain::OrderIntent intent);

  ~ParentOrderTask();

  ParentOrderTask(const ParentOrderTask&) = delete;
  ParentOrderTask& operator=(const ParentOrderTask&) = delete;
  ParentOrderTask(ParentOrderTask&&) = delete;
  ParentOrderTask& operator=(ParentOrderTask&&) = delete;

  void start();

  // Cooperative cancel; observed at the next suspension point.
  void requestCancel();

  // Cancel plus stop waiting on an in-flight slice. Used at shutdown.
  void abort();

  void join();

  bool finished() const { return finished_.load(); }
  domain::OrderId id() const { return id_; }
  domain::ParentOrderReport report() const;

 private:
  void run();

  // false if the wait was cut short by a cancel.
  bool waitFor(std::chrono::milliseconds delay);

  // Waits for the slice in short steps so abort() is noticed.
  std::optional<domain::ChildOrderSlice> awaitSlice(domain::SliceId slice_id);

  void finish(domain::ParentStatus status, domain::ErrorCode reason,
              std::string message);
  void publishReport();

  const SchedulerContext& ctx_;
  const domain::OrderId id_;
  const domain::OrderIntent intent_;

  std::atomic<bool> cancel_requested_{false};
  std::atomic<bool> abort_requested_{false};
  std::atomic<bool> finished_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  mutable std::mutex report_mutex_;
  domain::ParentOrderReport report_;

  std::thread thread_;
};

}  // namespace tradeguard
