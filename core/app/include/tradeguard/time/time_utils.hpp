#pragma once

#include <chrono>
#include <cstdint>

namespace tradeguard {

// Wall-clock time point carried by every fill, alert and event.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// ms_to_timestamp(ms)
// -----------------------------------------------------------------------------
// @brief  Converts epoch milliseconds (as returned by ITimeProvider::now_ms())
//         to a Timestamp.
// -----------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// Inverse of ms_to_timestamp(); truncates sub-millisecond precision.
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace tradeguard
