#pragma once

#include "tradeguard/domain/market_snapshot.hpp"

#include <optional>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IMarketDataSource — read side of the market data collaborator
// -----------------------------------------------------------------------------
// Consulted by the MinSlippage (spread) and Participation (volume) slice
// sizing right before each emission, and by SimulatedVenue to price fills. Returns std::nullopt for an instrument
// that has not ticked yet.
//
// Thread-safety: Implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual std::optional<domain::MarketSnapshot> snapshot(
      const std::string& instrument) const = 0;
};

}  // namespace tradeguard
