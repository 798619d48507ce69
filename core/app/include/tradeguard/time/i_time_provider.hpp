#pragma once

#include "tradeguard/time/time_utils.hpp"

#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// ITimeProvider — injectable clock
// -----------------------------------------------------------------------------
//
// @brief  Source of the timestamps stamped on fills, alerts, slices and risk
//         snapshots, and of "now" for trailing alert windows.
//
// @details
// Production wiring uses LiveTimeProvider. Tests inject a
// SimulationTimeProvider so alert windows and timestamps are deterministic.
// Only timestamps come from here: pacing delays and retry backoff are real
// waits on std::chrono::steady_clock.
//
// Thread-safety: Implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;

  Timestamp now() const { return ms_to_timestamp(now_ms()); }
};

}  // namespace tradeguard
