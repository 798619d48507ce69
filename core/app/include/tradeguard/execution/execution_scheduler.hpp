#pragma once

#include "tradeguard/concurrent/id_generator.hpp"
#include "tradeguard/domain/order_intent.hpp"
#include "tradeguard/domain/parent_order_report.hpp"
#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/execution/order_lifecycle_engine.hpp"
#include "tradeguard/execution/parent_order_task.hpp"
#include "tradeguard/execution/slice_sequence.hpp"
#include "tradeguard/market/i_market_data_source.hpp"
#include "tradeguard/risk/position_ledger.hpp"
#include "tradeguard/risk/risk_config_store.hpp"
#include "tradeguard/risk/risk_rule_engine.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// ExecutionScheduler — paces accepted parent orders into child slices
// -----------------------------------------------------------------------------
//
// @brief  Builds the SliceSequence for an intent and runs each accepted
//         parent as an independent ParentOrderTask on its own thread.
//
// @details
// The scheduler never submits anything itself. Each ParentOrderTask consults
// the RiskRuleEngine before every slice and hands accepted slices to the
// OrderLifecycleEngine, so there is no path from intake to the venue that
// skips a risk evaluation.
//
// Finished tasks are joined lazily (on the next launch() or activeCount())
// and their final report is kept for report() queries. Only the last
// retained_reports reports are kept; retiring one also releases the
// parent's slice history in the lifecycle engine. A kept report's
// filled_quantity is re-read from the lifecycle engine, so fills that
// arrive after the parent finished still show up in it.
//
// halt() refuses further launches until resume() and cancels every
// working parent, under the same lock launch() takes.
//
// Every per-slice risk check and the registration of the slice that passed
// it run under one admission lock shared by all tasks, so two parents on
// the same instrument never both pass a check the pair would fail.
//
// Thread model:
//   launch(), cancel(), report() and friends are safe from any thread.
//   tasks_ and completed_ are guarded by mutex_. halt() never joins, so it
//   may be called from a task thread (fill timeout escalation).
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr, constructed after the
//   lifecycle engine and destroyed before it. The destructor aborts and
//   joins every task.
// -----------------------------------------------------------------------------
class ExecutionScheduler {
 public:
  using HaltHandler = SchedulerContext::HaltHandler;

  static constexpr std::size_t kDefaultRetainedReports = 1024;

  ExecutionScheduler(EventBus& bus, OrderLifecycleEngine& lifecycle,
                     PositionLedger& ledger, const RiskRuleEngine& rules,
                     const RiskConfigStore& config,
                     const IMarketDataSource* market, IdGenerator& slice_ids,
                     const ITimeProvider& clock,
                     std::chrono::milliseconds fill_timeout,
                     HaltHandler on_halt = {},
                     std::size_t retained_reports = kDefaultRetainedReports);

  ~ExecutionScheduler();

  ExecutionScheduler(const ExecutionScheduler&) = delete;
  ExecutionScheduler& operator=(const ExecutionScheduler&) = delete;
  ExecutionScheduler(ExecutionScheduler&&) = delete;
  ExecutionScheduler& operator=(ExecutionScheduler&&) = delete;

  // -------------------------------------------------------------------------
  // schedule(intent)
  // -------------------------------------------------------------------------
  // Fresh sequence for the intent, starting at slice 0. Calling it again
  // restarts from the beginning; there is no resume.
  // -------------------------------------------------------------------------
  static SliceSequence schedule(const domain::OrderIntent& intent);

  // Starts a ParentOrderTask for an intent that passed intake. false when
  // the scheduler is halted or shut down; nothing is started then.
  bool launch(domain::OrderId id, domain::OrderIntent intent);

  // Cooperative cancel. false for an unknown or already finished parent.
  bool cancel(domain::OrderId id);

  // Refuses launch() and cancels every working parent until resume().
  void halt();
  void resume();
  bool halted() const;

  // Aborts and joins every task. launch() is refused afterwards.
  void shutdown();

  std::optional<domain::ParentOrderReport> report(domain::OrderId id) const;
  std::vector<domain::ParentOrderReport> reports() const;

  // Blocks until the parent is terminal or the timeout expires; returns the
  // latest report either way (std::nullopt for an unknown id).
  std::optional<domain::ParentOrderReport> awaitCompletion(
      domain::OrderId id, std::chrono::milliseconds timeout);

  std::size_t activeCount();

 private:
  void reapLocked();
  void retireLocked(domain::OrderId id, domain::ParentOrderReport report);
  domain::ParentOrderReport withLateFills(domain::ParentOrderReport report) const;

  std::mutex admission_mutex_;
  SchedulerContext ctx_;
  const std::size_t retained_reports_;

  mutable std::mutex mutex_;
  std::map<domain::OrderId, std::unique_ptr<ParentOrderTask>> tasks_;
  std::map<domain::OrderId, domain::ParentOrderReport> completed_;
  std::deque<domain::OrderId> completed_order_;
  bool shut_down_{false};
  bool halted_{false};

  std::mutex done_mutex_;
  std::condition_variable done_cv_;
};

}  // namespace tradeguard
