#pragma once

#include "tradeguard/domain/risk_limits.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace tradeguard {

// -----------------------------------------------------------------------------
// RiskConfigStore — owner of the RiskLimitConfig in force
// -----------------------------------------------------------------------------
//
// @brief  Publishes immutable RiskLimitConfig instances and swaps them
//         atomically on reconfiguration.
//
// @details
// current() hands out a std::shared_ptr<const RiskLimitConfig>. A caller
// holds that pointer for the whole of one evaluation (a risk check, a
// monitor tick), so a concurrent replace() can never change thresholds
// halfway through: the old instance stays alive until its last reader
// drops it, and the next evaluation picks up the new one.
//
// replace() validates first and throws domain::ConfigError on a negative
// threshold, leaving the previous configuration in force.
//
// Thread-safety: current(), replace() and version() are safe from any thread.
// -----------------------------------------------------------------------------
class RiskConfigStore {
 public:
  explicit RiskConfigStore(domain::RiskLimitConfig initial = {});

  RiskConfigStore(const RiskConfigStore&) = delete;
  RiskConfigStore& operator=(const RiskConfigStore&) = delete;

  std::shared_ptr<const domain::RiskLimitConfig> current() const;

  void replace(domain::RiskLimitConfig next);

  // Incremented on every successful replace(); starts at 1.
  std::uint64_t version() const;

  // Throws domain::ConfigError naming the first invalid field.
  static void validate(const domain::RiskLimitConfig& config);

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const domain::RiskLimitConfig> config_;
  std::uint64_t version_{1};
};

}  // namespace tradeguard
