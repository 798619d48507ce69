#pragma once

#include "tradeguard/events/alert_event.hpp"
#include "tradeguard/events/event_types.hpp"
#include "tradeguard/events/parent_order_update_event.hpp"
#include "tradeguard/events/position_update_event.hpp"
#include "tradeguard/events/slice_update_event.hpp"

#include <variant>

namespace tradeguard {

// Every event that travels over an EventBus.
using Event = std::variant<
    MarketDataEvent,
    RiskRejectEvent,
    SliceUpdateEvent,
    ParentOrderUpdateEvent,
    PositionUpdateEvent,
    AlertEvent>;

}  // namespace tradeguard
