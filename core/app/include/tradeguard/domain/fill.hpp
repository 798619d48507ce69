#pragma once

#include "tradeguard/domain/child_order_slice.hpp"
#include "tradeguard/domain/order_intent.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <string>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// Fill — one confirmed (possibly partial) execution of a ChildOrderSlice
// -----------------------------------------------------------------------------
//
// @brief  Delivered asynchronously by the venue through the fill sink and
//         applied to the PositionLedger exactly once.
//
// @details
// fill_id is the venue's execution id. The ledger keeps every fill_id it has
// applied, so a redelivered fill is detected and ignored rather than double
// counted. quantity is always positive; the direction comes from the slice
// the fill belongs to.
// -----------------------------------------------------------------------------
struct Fill {
  std::string fill_id;
  SliceId slice_id{};
  std::string venue_order_id;
  Quantity quantity{0};
  double price{0.0};
  Timestamp timestamp{};
};

}  // namespace domain
}  // namespace tradeguard
