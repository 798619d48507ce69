#include "tradeguard/risk/risk_config_store.hpp"
#include "tradeguard/domain/error_code.hpp"

#include <cmath>
#include <iostream>
#include <string>

namespace tradeguard {

namespace {

void requireNonNegative(double value, const char* field) {
  if (!std::isfinite(value) || value < 0.0) {
    throw domain::ConfigError(std::string("risk limit '") + field +
                              "' must be a finite value >= 0, got " +
                              std::to_string(value));
  }
}

void requirePercent(double value, const char* field) {
  requireNonNegative(value, field);
  if (value > 100.0) {
    throw domain::ConfigError(std::string("risk limit '") + field +
                              "' is a percentage and must be <= 100, got " +
                              std::to_string(value));
  }
}

}  // namespace

RiskConfigStore::RiskConfigStore(domain::RiskLimitConfig initial) {
  validate(initial);
  config_ = std::make_shared<const domain::RiskLimitConfig>(initial);
}

std::shared_ptr<const domain::RiskLimitConfig> RiskConfigStore::current()
    const {
  std::lock_guard lock(mutex_);
  return config_;
}

// -----------------------------------------------------------------------------
// replace: validate, then swap
// -----------------------------------------------------------------------------
void RiskConfigStore::replace(domain::RiskLimitConfig next) {
  validate(next);
  auto fresh = std::make_shared<const domain::RiskLimitConfig>(next);

  std::uint64_t version = 0;
  {
    std::lock_guard lock(mutex_);
    config_ = std::move(fresh);
    version = ++version_;
  }
  std::cout << "[RiskConfigStore] risk limits replaced, version=" << version
            << "\n";
}

std::uint64_t RiskConfigStore::version() const {
  std::lock_guard lock(mutex_);
  return version_;
}

void RiskConfigStore::validate(const domain::RiskLimitConfig& config) {
  requireNonNegative(config.max_position_size, "max_position_size");
  requireNonNegative(config.max_loss, "max_loss");
  requirePercent(config.max_drawdown_percent, "max_drawdown_percent");
  requirePercent(config.stop_loss_percent, "stop_loss_percent");
  requireNonNegative(config.take_profit_percent, "take_profit_percent");
  requireNonNegative(config.max_exposure_percent, "max_exposure_percent");
  requirePercent(config.max_risk_percent, "max_risk_percent");
  requirePercent(config.assumed_volatility_percent,
                 "assumed_volatility_percent");
}

}  // namespace tradeguard
