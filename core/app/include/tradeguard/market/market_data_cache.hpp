#pragma once

#include "tradeguard/events/event_types.hpp"
#include "tradeguard/market/i_market_data_source.hpp"

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tradeguard {

// -----------------------------------------------------------------------------
// MarketDataCache — latest MarketSnapshot per instrument
// -----------------------------------------------------------------------------
//
// @brief  Written by TradingEngine for every MarketDataEvent (from the ZMQ
//         gateway or injected by tests); read by slice sizing and the
//         simulated venue.
//
// @details
// A tick with a zero bid or ask takes the last price for the missing side.
// Ticks older than the stored one for the same instrument are dropped.
//
// Thread model: update() from the market data thread, snapshot() from any
//               thread. Guarded by a shared_mutex.
// -----------------------------------------------------------------------------
class MarketDataCache final : public IMarketDataSource {
 public:
  MarketDataCache() = default;

  MarketDataCache(const MarketDataCache&) = delete;
  MarketDataCache& operator=(const MarketDataCache&) = delete;

  void update(const MarketDataEvent& event);

  std::optional<domain::MarketSnapshot> snapshot(
      const std::string& instrument) const override;

  std::size_t instrumentCount() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::MarketSnapshot> snapshots_;
};

}  // namespace tradeguard
