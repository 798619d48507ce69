#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId / Quantity
// -----------------------------------------------------------------------------
// OrderId identifies a parent order accepted at intake. Quantities are whole
// numbers of the instrument's smallest tradable unit, so slice sums are exact
// integer arithmetic with no rounding drift.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;
using Quantity = std::int64_t;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// Signed quantity: +qty for Buy, -qty for Sell.
inline Quantity signedQuantity(Side side, Quantity qty) {
  return side == Side::Buy ? qty : -qty;
}

// -----------------------------------------------------------------------------
// Pacing parameters
// -----------------------------------------------------------------------------
// One struct per pacing algorithm. The set is closed: PacingSpec is a
// std::variant over exactly these alternatives, and SliceSequence visits it.
// -----------------------------------------------------------------------------

// N equal slices spread evenly over the horizon.
struct TwapParams {
  std::size_t slices{10};
  std::chrono::milliseconds horizon{std::chrono::seconds(60)};
};

// Slice sizes follow a historical volume curve. Weights need not sum to 1;
// they are normalized when the sequence is built.
struct VwapParams {
  std::vector<double> weights;
  std::chrono::milliseconds horizon{std::chrono::seconds(60)};
};

// Fixed clip size, repeated until the parent quantity is exhausted.
struct IcebergParams {
  Quantity clip_size{100};
  std::chrono::milliseconds interval{std::chrono::seconds(5)};
};

// Clip size that shrinks as the quoted spread widens beyond base_spread_bps.
struct MinSlippageParams {
  Quantity clip_size{100};
  std::chrono::milliseconds interval{std::chrono::seconds(5)};
  double base_spread_bps{5.0};
};

// Participate in a share of the traded volume: each slice is
// participation_rate of the last reported trade volume, falling back to
// clip_size while no volume has been seen.
struct ParticipationParams {
  double participation_rate{0.10};
  Quantity clip_size{100};
  std::chrono::milliseconds interval{std::chrono::seconds(5)};
};

using PacingSpec = std::variant<TwapParams, VwapParams, IcebergParams,
                                MinSlippageParams, ParticipationParams>;

// -----------------------------------------------------------------------------
// OrderIntent
// -----------------------------------------------------------------------------
// Responsibility: A caller's request to trade a total quantity of one
// instrument, paced by the chosen algorithm. Validated at intake
// (quantity > 0, known instrument, well-formed pacing parameters) before it
// ever reaches the risk rules.
// -----------------------------------------------------------------------------
struct OrderIntent {
  std::string instrument;
  Side side{Side::Buy};
  Quantity quantity{0};
  PacingSpec pacing{TwapParams{}};
  std::optional<double> limit_price;  // Passed through to every slice
};

}  // namespace domain
}  // namespace tradeguard
