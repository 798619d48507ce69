#include "tradeguard/risk/alert_log.hpp"
#include "tradeguard/domain/to_string.hpp"
#include "tradeguard/events/alert_event.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>

namespace tradeguard {

AlertLog::AlertLog(EventBus& bus, const ITimeProvider& clock)
    : bus_(bus), clock_(clock) {}

// -----------------------------------------------------------------------------
// raise: stamp, append, log, publish
// -----------------------------------------------------------------------------
domain::Alert AlertLog::raise(domain::AlertSeverity severity,
                              std::string source, std::string message,
                              double value, double threshold) {
  domain::Alert alert;
  alert.severity = severity;
  alert.source = std::move(source);
  alert.message = std::move(message);
  alert.value = value;
  alert.threshold = threshold;
  alert.timestamp = clock_.now();

  {
    std::lock_guard lock(mutex_);
    alert.id = next_id_++;
    alerts_.push_back(alert);
  }

  std::ostream& out =
      severity == domain::AlertSeverity::Critical ? std::cerr : std::cout;
  out << "[AlertLog] " << domain::toString(severity) << " #" << alert.id
      << " " << alert.source << ": " << alert.message << "\n";

  bus_.publish(AlertEvent{alert});
  return alert;
}

std::vector<domain::Alert> AlertLog::all() const {
  std::lock_guard lock(mutex_);
  return alerts_;
}

std::vector<domain::Alert> AlertLog::recent(std::size_t max_count) const {
  std::lock_guard lock(mutex_);
  std::size_t skip = alerts_.size() > max_count ? alerts_.size() - max_count : 0;
  return std::vector<domain::Alert>(alerts_.begin() + skip, alerts_.end());
}

std::vector<domain::Alert> AlertLog::bySeverity(
    domain::AlertSeverity severity) const {
  std::vector<domain::Alert> out;
  std::lock_guard lock(mutex_);
  std::copy_if(alerts_.begin(), alerts_.end(), std::back_inserter(out),
               [severity](const domain::Alert& a) {
                 return a.severity == severity;
               });
  return out;
}

std::size_t AlertLog::countSince(Timestamp since) const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(alerts_.begin(), alerts_.end(),
                    [since](const domain::Alert& a) {
                      return a.timestamp >= since;
                    }));
}

std::size_t AlertLog::countInWindow(std::chrono::milliseconds window) const {
  return countSince(clock_.now() - window);
}

std::size_t AlertLog::size() const {
  std::lock_guard lock(mutex_);
  return alerts_.size();
}

}  // namespace tradeguard
