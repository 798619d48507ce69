#pragma once

#include "tradeguard/domain/alert.hpp"
#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/time/i_time_provider.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// AlertLog — append-only store and feed of Alerts
// -----------------------------------------------------------------------------
//
// @brief  Assigns ids and timestamps to alerts, keeps them in arrival order,
//         and publishes each one as an AlertEvent.
//
// @details
// Raised by the RiskMonitor on threshold crossings, and by the
// OrderLifecycleEngine when the ledger refuses a fill. Entries are never
// modified or removed. Every raise is also written to the log: Critical to
// std::cerr, the rest to std::cout.
//
// Thread model: raise() and the readers are safe from any thread. The
// AlertEvent is published after the internal lock is released.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Holds references to the
//   core EventBus and ITimeProvider.
// -----------------------------------------------------------------------------
class AlertLog {
 public:
  AlertLog(EventBus& bus, const ITimeProvider& clock);

  AlertLog(const AlertLog&) = delete;
  AlertLog& operator=(const AlertLog&) = delete;

  domain::Alert raise(domain::AlertSeverity severity, std::string source,
                      std::string message, double value = 0.0,
                      double threshold = 0.0);

  std::vector<domain::Alert> all() const;

  // Up to max_count most recent alerts, oldest first.
  std::vector<domain::Alert> recent(std::size_t max_count) const;

  // Every alert of the given severity, oldest first.
  std::vector<domain::Alert> bySeverity(domain::AlertSeverity severity) const;

  // Alerts stamped at or after since.
  std::size_t countSince(Timestamp since) const;

  // Alerts raised in the trailing window ending at the clock's now().
  std::size_t countInWindow(std::chrono::milliseconds window) const;

  std::size_t size() const;

 private:
  EventBus& bus_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::vector<domain::Alert> alerts_;
  std::uint64_t next_id_{1};
};

}  // namespace tradeguard
