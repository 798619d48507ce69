#pragma once

#include "tradeguard/concurrent/event_loop_thread.hpp"
#include "tradeguard/concurrent/id_generator.hpp"
#include "tradeguard/config/engine_config.hpp"
#include "tradeguard/domain/alert.hpp"
#include "tradeguard/domain/error_code.hpp"
#include "tradeguard/domain/order_intent.hpp"
#include "tradeguard/domain/parent_order_report.hpp"
#include "tradeguard/domain/position.hpp"
#include "tradeguard/domain/risk_decision.hpp"
#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/domain/risk_snapshot.hpp"
#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/execution/execution_scheduler.hpp"
#include "tradeguard/execution/i_venue_adapter.hpp"
#include "tradeguard/execution/order_lifecycle_engine.hpp"
#include "tradeguard/execution/simulated_venue.hpp"
#include "tradeguard/market/market_data_cache.hpp"
#include "tradeguard/network/ipc_server.hpp"
#include "tradeguard/network/market_data_thread.hpp"
#include "tradeguard/risk/alert_log.hpp"
#include "tradeguard/risk/i_reconciler.hpp"
#include "tradeguard/risk/position_ledger.hpp"
#include "tradeguard/risk/risk_config_store.hpp"
#include "tradeguard/risk/risk_monitor.hpp"
#include "tradeguard/risk/risk_rule_engine.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IntakeResult
// -----------------------------------------------------------------------------
// Synchronous answer to submitIntent(). ValidationError also covers intents
// refused because the engine is stopped (NotRunning) or halted
// (EngineHalted); error says which.
// -----------------------------------------------------------------------------
struct IntakeResult {
  enum class Outcome {
    Accepted,
    ValidationError,
    RiskRejected,
  };

  Outcome outcome{Outcome::ValidationError};
  domain::OrderId order_id{0};  // Set for Accepted and RiskRejected
  domain::ErrorCode error{domain::ErrorCode::None};
  std::vector<domain::RuleViolation> violations;
  std::string message;

  bool accepted() const { return outcome == Outcome::Accepted; }
};

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator: owns the ledger, the risk components, the
//         scheduler and lifecycle engine, and every thread.
//
// @details
// Provides a lifecycle API (start/stop) plus the intake surface, so main()
// and tests never wire internals by hand.
//
// Thread layout:
//
//   parent order tasks       → one thread per working parent (scheduler)
//   venue fill thread        → SimulatedVenue (or the adapter's own thread)
//   risk monitor thread      → periodic supervision pass
//   notification loop        → re-publishes core events for observers
//   ipc thread               → command REP + telemetry PUB
//   market data thread       → MarketDataGateway ZMQ recv loop
//
// Cross-thread bridges (wired in start()):
//   1. core bus       →  notification loop: every event (async observers)
//   2. core bus       →  ipc server:        every event (telemetry)
//   3. market data    →  cache + ledger marks (pushMarketData)
//   4. scheduler / monitor → halt(): fill timeouts and escalated alerts
//
// The core EventBus is synchronous: ledger, lifecycle and scheduler publish
// on their own threads. Subscribers that must not block those threads should
// subscribe to notificationBus() instead.
//
// Ownership:
//   TradingEngine
//    ├── config_store_, rules_     (value members, process lifetime)
//    ├── bus_, notification_loop_  (value members)
//    ├── market_cache_             (value member)
//    ├── owned_venue_              (unique_ptr<SimulatedVenue>, only when no
//    │                              venue is injected)
//    ├── ledger_, alerts_          (value members; survive stop/start)
//    ├── lifecycle_, scheduler_    (unique_ptr, created in start())
//    ├── monitor_                  (unique_ptr, created in start())
//    ├── ipc_server_               (unique_ptr, only with both endpoints)
//    └── market_data_thread_       (unique_ptr, only with an endpoint)
//
// Parent order reports live in the scheduler, so they are dropped by stop().
//
// Locking:
//   lifecycle_mutex_ serializes start() and stop(). state_mutex_ guards the
//   per-run component pointers and the running flag: intake, queries and
//   halt() take it shared, start() and stop() take it exclusively. stop()
//   holds it only while it detaches the components, then tears them down
//   unlocked, because a parent task being joined may still call halt().
//   halt_mutex_ keeps halt() and resume() from interleaving, so halted_ and
//   the scheduler's own halt flag always agree.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config  Engine configuration (risk limits are validated here and
  //                 a bad set throws domain::ConfigError).
  // @param  clock   Timestamp source. Must outlive the engine.
  // @param  venue   Optional venue adapter; must outlive the engine. When
  //                 null, the engine owns a SimulatedVenue priced from the
  //                 market data cache.
  //
  // No threads are spawned and no sockets are opened in the constructor.
  // -------------------------------------------------------------------------
  TradingEngine(EngineConfig config, const ITimeProvider& clock,
                IVenueAdapter* venue = nullptr);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start(reconciler)
  // -------------------------------------------------------------------------
  //
  // @brief  Brings the engine to a running state.
  //
  // @details
  // Startup sequence:
  //   1. Synchronization gate: hydrate positions and cash from the
  //      reconciler (if any), then start a fresh risk session.
  //   2. Start the notification loop.
  //   3. Create the lifecycle engine and scheduler.
  //   4. Start IpcServer and wire the telemetry bridges.
  //   5. Start the Risk Monitor.
  //   6. Start MarketDataThread LAST so every consumer is live before the
  //      first tick.
  //
  // Idempotent. Safe against a concurrent stop().
  // -------------------------------------------------------------------------
  void start(IReconciler* reconciler = nullptr);

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Stops intake and market data, aborts every working parent (their
  // reports end Canceled), joins all threads. Idempotent; start() may be
  // called again. Intake racing with stop() is refused with NotRunning.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // submitIntent(intent)
  // -------------------------------------------------------------------------
  //
  // @brief  Validates an intent, runs the pre-trade risk check and hands it
  //         to the scheduler.
  //
  // @details
  // Checks, in order: running, not halted, quantity > 0, known instrument
  // (only when the config lists instruments), well-formed pacing. The
  // pre-trade check evaluates the whole parent quantity plus whatever is
  // still working at the venue for the instrument. A rejection publishes
  // RiskRejectEvent with at_intake set and never reaches the scheduler.
  // A halt that lands between the checks and the launch is still honoured:
  // the scheduler refuses the launch and the intent is refused with
  // EngineHalted.
  //
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  IntakeResult submitIntent(const domain::OrderIntent& intent);

  // Cooperative cancel of a working parent. false for an unknown or finished
  // parent, or when the engine is stopped.
  bool cancel(domain::OrderId id);

  std::optional<domain::ParentOrderReport> orderStatus(
      domain::OrderId id) const;
  std::vector<domain::ParentOrderReport> orderReports() const;

  // Blocks until the parent is terminal or the timeout expires.
  std::optional<domain::ParentOrderReport> awaitOrder(
      domain::OrderId id, std::chrono::milliseconds timeout);

  // -------------------------------------------------------------------------
  // riskStatus()
  // -------------------------------------------------------------------------
  // Latest monitor snapshot with the alert count over the configured alert
  // window. Before the first monitor pass (or while stopped) the metrics are
  // computed on the spot from the ledger.
  // -------------------------------------------------------------------------
  domain::RiskSnapshot riskStatus() const;

  // -------------------------------------------------------------------------
  // reconfigure(limits)
  // -------------------------------------------------------------------------
  // Atomically replaces the risk limits. Throws domain::ConfigError and
  // keeps the current limits if the new set is invalid.
  // -------------------------------------------------------------------------
  void reconfigure(const domain::RiskLimitConfig& limits);

  std::shared_ptr<const domain::RiskLimitConfig> riskLimits() const;

  // -------------------------------------------------------------------------
  // halt(reason) / resume()
  // -------------------------------------------------------------------------
  // halt() stops intake, cancels every working parent and raises one
  // Critical "engine_halted" alert. Safe from any thread, including
  // scheduler and monitor threads. resume() re-opens intake only.
  // -------------------------------------------------------------------------
  void halt(const std::string& reason);
  void resume();
  bool isHalted() const { return halted_.load(); }

  // New risk session: ledger peak and session PnL re-baselined, monitor
  // detectors re-armed.
  void resetSession();

  // -------------------------------------------------------------------------
  // pushMarketData(event)
  // -------------------------------------------------------------------------
  // Updates the market data cache and marks the ledger (last price, or mid
  // when no trade price is present). This is the sink bound to
  // MarketDataThread; tests call it directly.
  // -------------------------------------------------------------------------
  void pushMarketData(const MarketDataEvent& event);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @return JSON-formatted response string.
  //
  // @details
  // Supported commands:
  //   "PING"           → {"status":"ok","response":"PONG"}
  //   "STATUS"         → running/halted flags, positions, aggregate, orders
  //   "RISK"           → latest risk snapshot, the active limits and every
  //                      Critical alert raised so far
  //   "SUBMIT <json>"  → {"status":"ok","order_id":N} or an error with the
  //                      error code and any violations
  //   "CANCEL <id>"    → {"status":"ok"} or an error
  //   "RECONFIGURE <json>" → replaces the named risk limits, keeping the
  //                      rest; replies with the new limits
  //   "HALT"           → halts intake and cancels working parents
  //   "RESUME"         → re-opens intake
  //   "RESET_SESSION"  → starts a new risk session
  //   other            → {"status":"error","response":"Unknown command: ..."}
  //
  // Thread model: Called on the IPC server thread; safe from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Core bus: synchronous, events arrive on the producing thread.
  EventBus& eventBus() { return bus_; }

  // Notification bus: the same events, delivered on the notification loop.
  EventBus& notificationBus() { return notification_loop_.eventBus(); }

  domain::LedgerSnapshot ledgerSnapshot() const { return ledger_.snapshot(); }
  std::optional<domain::Position> position(const std::string& instrument) const;
  std::vector<domain::Alert> alerts() const { return alerts_.all(); }
  std::vector<domain::Alert> criticalAlerts() const {
    return alerts_.bySeverity(domain::AlertSeverity::Critical);
  }

  const EngineConfig& config() const { return config_; }

 private:
  IntakeResult refuse(domain::ErrorCode code, std::string message) const;

  const EngineConfig config_;
  const ITimeProvider& clock_;

  // --- ID generators (value members, outlive all components) ----------------
  IdGenerator order_ids_;
  IdGenerator slice_ids_;

  // --- Risk configuration and rules -----------------------------------------
  RiskConfigStore config_store_;
  RiskRuleEngine rules_;

  // --- Event distribution ---------------------------------------------------
  EventBus bus_;
  EventLoopThread notification_loop_;
  EventBus::SubscriptionId bridge_subscription_{0};
  bool bridge_wired_{false};

  // --- Market data and venue ------------------------------------------------
  MarketDataCache market_cache_;
  std::unique_ptr<SimulatedVenue> owned_venue_;
  IVenueAdapter& venue_;

  // --- Stateful components (survive stop/start) -----------------------------
  PositionLedger ledger_;
  AlertLog alerts_;

  // --- Per-run components (heap-allocated for controlled destruction) -------
  std::unique_ptr<OrderLifecycleEngine> lifecycle_;
  std::unique_ptr<ExecutionScheduler> scheduler_;
  std::unique_ptr<RiskMonitor> monitor_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  std::mutex lifecycle_mutex_;
  mutable std::shared_mutex state_mutex_;
  std::mutex halt_mutex_;

  std::atomic<bool> running_{false};
  std::atomic<bool> halted_{false};
};

}  // namespace tradeguard
