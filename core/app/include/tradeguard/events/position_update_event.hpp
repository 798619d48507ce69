#pragma once

#include "tradeguard/domain/position.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
// Emitted by PositionLedger after every applied fill. position is a copy
// taken under the ledger lock; the event holds no reference into the ledger.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  std::string fill_id;
  Timestamp timestamp{};
};

}  // namespace tradeguard
