#pragma once

#include "tradeguard/time/i_time_provider.hpp"

namespace tradeguard {

// Wall-clock implementation backed by std::chrono::system_clock.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradeguard
