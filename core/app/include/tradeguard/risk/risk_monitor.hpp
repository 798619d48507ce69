#pragma once

#include "tradeguard/domain/alert.hpp"
#include "tradeguard/domain/position.hpp"
#include "tradeguard/domain/risk_limits.hpp"
#include "tradeguard/domain/risk_snapshot.hpp"
#include "tradeguard/risk/alert_log.hpp"
#include "tradeguard/risk/position_ledger.hpp"
#include "tradeguard/risk/risk_config_store.hpp"
#include "tradeguard/risk/threshold_crossing_detector.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace tradeguard {

// -----------------------------------------------------------------------------
// RiskMonitor — periodic portfolio risk supervision
// -----------------------------------------------------------------------------
//
// @brief  Recomputes exposure, risk, drawdown and session loss from a ledger
//         snapshot on a fixed period and raises one Alert per upward
//         threshold crossing.
//
// @details
// Metrics (see compute()):
//
//   exposure %  = gross exposure / portfolio value * 100
//   risk %      = gross exposure * stop distance / portfolio value,
//                 stop distance = stop_loss_percent, or
//                 assumed_volatility_percent when the stop loss is disabled
//   drawdown %  = (peak - value) / peak * 100
//   session loss = max(0, -session PnL)
//
// Exposure and risk are 0 when the portfolio value is not positive.
//
// Alerting is edge-triggered through one ThresholdCrossingDetector per
// metric. Exposure and risk crossings are Warning, drawdown and loss
// crossings Critical. When escalate_alerts_to_halt is set in the current
// config, every raised alert is also handed to the escalation handler
// (TradingEngine halts intake and cancels working parents).
//
// Thread model:
//   start() runs tick() immediately, then every interval on the monitor
//   thread. tick() may also be called directly (tests, IPC); ticks are
//   serialized by tick_mutex_. latest() only takes latest_mutex_, so it
//   never waits for a tick in progress. The ledger is only read.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. References the ledger,
//   config store, alert log and clock. Destructor stops the thread.
// -----------------------------------------------------------------------------
class RiskMonitor {
 public:
  using EscalationHandler = std::function<void(const domain::Alert&)>;

  RiskMonitor(const PositionLedger& ledger, const RiskConfigStore& config,
              AlertLog& alerts, const ITimeProvider& clock,
              std::chrono::milliseconds interval,
              std::chrono::milliseconds alert_window,
              EscalationHandler on_escalate = {});

  ~RiskMonitor();

  RiskMonitor(const RiskMonitor&) = delete;
  RiskMonitor& operator=(const RiskMonitor&) = delete;
  RiskMonitor(RiskMonitor&&) = delete;
  RiskMonitor& operator=(RiskMonitor&&) = delete;

  void start();
  void stop();
  bool isRunning() const { return running_.load(); }

  // One supervision pass. Returns the snapshot it stored as latest().
  domain::RiskSnapshot tick();

  domain::RiskSnapshot latest() const;

  // Re-arms every detector, e.g. after a session reset.
  void resetDetectors();

  std::uint64_t tickCount() const { return ticks_.load(); }

  // Pure metric computation; alerts_in_window and timestamp are left 0.
  static domain::RiskSnapshot compute(const domain::LedgerSnapshot& ledger,
                                      const domain::RiskLimitConfig& limits);

 private:
  void run();

  const PositionLedger& ledger_;
  const RiskConfigStore& config_;
  AlertLog& alerts_;
  const ITimeProvider& clock_;
  const std::chrono::milliseconds interval_;
  const std::chrono::milliseconds alert_window_;
  EscalationHandler on_escalate_;

  std::mutex tick_mutex_;
  ThresholdCrossingDetector exposure_detector_;
  ThresholdCrossingDetector risk_detector_;
  ThresholdCrossingDetector drawdown_detector_;
  ThresholdCrossingDetector loss_detector_;

  mutable std::mutex latest_mutex_;
  domain::RiskSnapshot latest_;

  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace tradeguard
