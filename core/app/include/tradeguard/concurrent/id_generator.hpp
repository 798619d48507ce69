#pragma once

#include <atomic>
#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IdGenerator — thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids starting at 1. Id 0 is reserved as "unset".
//
// @details
// TradingEngine owns one generator for parent order ids and one for slice
// ids. Parent tasks run on their own threads and draw slice ids
// concurrently, so the counter is atomic. Relaxed ordering is enough: only
// uniqueness is required.
//
// Ownership:
//   Value member of TradingEngine, injected by reference into the
//   ExecutionScheduler. Outlives every component that holds it.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace tradeguard
