#include "tradeguard/market/market_data_cache.hpp"

#include <mutex>

namespace tradeguard {

// -----------------------------------------------------------------------------
// update: store the newest tick per instrument
// -----------------------------------------------------------------------------
void MarketDataCache::update(const MarketDataEvent& event) {
  if (event.instrument.empty()) {
    return;
  }

  domain::MarketSnapshot snap;
  snap.instrument = event.instrument;
  snap.last = event.last;
  snap.bid = event.bid > 0.0 ? event.bid : event.last;
  snap.ask = event.ask > 0.0 ? event.ask : event.last;
  snap.volume = event.volume > 0.0 ? event.volume : 0.0;
  snap.timestamp = event.timestamp;

  std::unique_lock lock(mutex_);
  auto it = snapshots_.find(event.instrument);
  if (it != snapshots_.end() && it->second.timestamp > snap.timestamp) {
    return;
  }
  snapshots_[event.instrument] = std::move(snap);
}

std::optional<domain::MarketSnapshot> MarketDataCache::snapshot(
    const std::string& instrument) const {
  std::shared_lock lock(mutex_);
  auto it = snapshots_.find(instrument);
  if (it == snapshots_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t MarketDataCache::instrumentCount() const {
  std::shared_lock lock(mutex_);
  return snapshots_.size();
}

}  // namespace tradeguard
