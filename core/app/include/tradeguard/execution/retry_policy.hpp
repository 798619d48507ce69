#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// RetryPolicy — bounded exponential backoff for transient venue errors
// -----------------------------------------------------------------------------
// Attempt k (1-based) that fails transiently is followed by a wait of
// initial_backoff * multiplier^(k-1), capped at max_backoff. After
// max_attempts failed attempts the slice is Failed.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds initial_backoff{50};
  double multiplier{2.0};
  std::chrono::milliseconds max_backoff{1000};

  std::chrono::milliseconds backoffAfter(int attempt) const {
    double delay = static_cast<double>(initial_backoff.count());
    for (int i = 1; i < attempt; ++i) {
      delay *= multiplier;
      if (delay >= static_cast<double>(max_backoff.count())) {
        return max_backoff;
      }
    }
    return std::min(
        std::chrono::milliseconds(static_cast<std::int64_t>(delay)),
        max_backoff);
  }
};

}  // namespace tradeguard
