#pragma once

#include "tradeguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — manually driven clock
// -----------------------------------------------------------------------------
// now_ms() returns whatever was last set. Starts at 0. Used by tests that
// need to move time across alert windows without sleeping.
//
// Thread-safety: atomic; safe to read and advance from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradeguard
