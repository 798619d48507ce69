#pragma once

#include "tradeguard/domain/market_snapshot.hpp"
#include "tradeguard/domain/order_intent.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tradeguard {

// One emission decided by a SliceSequence.
struct SliceInstruction {
  std::size_t index{0};                // 0-based emission count
  domain::Quantity quantity{0};        // Always > 0
  std::chrono::milliseconds delay{0};  // Wait before emitting; 0 for the first
};

// -----------------------------------------------------------------------------
// SliceSequence — lazy, finite sequence of slice sizes for one parent
// -----------------------------------------------------------------------------
//
// @brief  Visits the intent's PacingSpec and yields one SliceInstruction per
//         next() call until the parent quantity is exhausted.
//
// @details
// Sizing per algorithm:
//
//   TWAP         n = min(slices, total). Slices 0..n-2 get total / n, the
//                last one absorbs the integer-division remainder. One slice
//                every horizon / n.
//                1000 over 7 → 142 x 6, then 148.
//
//   VWAP         Weights are normalized to sum to 1. Slice i gets
//                round(w_i * total), clamped to what is left; the last
//                weight takes whatever remains, which corrects the
//                accumulated rounding error. A weight that rounds to 0 emits
//                nothing and its time step is folded into the next slice's
//                delay. Steps are uniform at horizon / weights.size().
//
//   Iceberg      min(clip_size, remaining) every interval.
//
//   MinSlippage  min(clip_size, f(spread, remaining)) every interval, where
//                f = remaining while the quoted spread is at or under
//                base_spread_bps, and otherwise
//                f = max(1, floor(min(clip_size, remaining) * base / spread)).
//                The spread comes from the market snapshot passed to next(),
//                read right before the emission. Without a snapshot the full
//                clip is used.
//
//   Participation  max(1, floor(volume * participation_rate)), capped at
//                what remains, every interval. volume is the last trade
//                size in the snapshot; with no snapshot or no volume the
//                slice is min(clip_size, remaining).
//
// Invariants: every emitted quantity is > 0, and once next() returns
// std::nullopt the emitted quantities sum to the parent quantity exactly.
//
// A sequence only moves forward. After a halt or cancel the remaining
// slices are discarded with it; ExecutionScheduler::schedule() always
// builds a fresh sequence from the beginning.
//
// Thread model: Not thread-safe. Owned and driven by one ParentOrderTask.
// -----------------------------------------------------------------------------
class SliceSequence {
 public:
  SliceSequence(domain::Quantity total, domain::PacingSpec pacing);

  // -------------------------------------------------------------------------
  // next(market)
  // -------------------------------------------------------------------------
  // @param  market  Latest snapshot for the instrument, or std::nullopt.
  //                 Only MinSlippage and Participation read it.
  //
  // @return The next instruction, or std::nullopt when exhausted.
  // -------------------------------------------------------------------------
  std::optional<SliceInstruction> next(
      const std::optional<domain::MarketSnapshot>& market = std::nullopt);

  // -------------------------------------------------------------------------
  // pendingDelay()
  // -------------------------------------------------------------------------
  // Wait the upcoming next() call will report, computed without consuming
  // anything. Lets the caller sleep first and size the slice afterwards
  // from a fresh market snapshot.
  // -------------------------------------------------------------------------
  std::chrono::milliseconds pendingDelay() const;

  domain::Quantity total() const { return total_; }
  domain::Quantity emitted() const { return emitted_; }
  domain::Quantity remaining() const { return total_ - emitted_; }
  std::size_t emittedCount() const { return count_; }
  bool exhausted() const { return emitted_ >= total_; }
  const domain::PacingSpec& pacing() const { return pacing_; }

  // -------------------------------------------------------------------------
  // validate(pacing)
  // -------------------------------------------------------------------------
  // @return std::nullopt if the parameters are usable, otherwise a
  //         description of the first problem. Used at intake to reject
  //         InvalidPacing before the risk check.
  // -------------------------------------------------------------------------
  static std::optional<std::string> validate(const domain::PacingSpec& pacing);

 private:
  struct Sizer;

  std::optional<SliceInstruction> nextTwap(const domain::TwapParams& p);
  std::optional<SliceInstruction> nextVwap(const domain::VwapParams& p);
  std::optional<SliceInstruction> nextIceberg(const domain::IcebergParams& p);
  std::optional<SliceInstruction> nextMinSlippage(
      const domain::MinSlippageParams& p,
      const std::optional<domain::MarketSnapshot>& market);
  std::optional<SliceInstruction> nextParticipation(
      const domain::ParticipationParams& p,
      const std::optional<domain::MarketSnapshot>& market);

  // TWAP slice count: min(slices, total), at least 1.
  domain::Quantity twapSlices(const domain::TwapParams& p) const;

  SliceInstruction emit(domain::Quantity qty, std::chrono::milliseconds delay);

  domain::Quantity total_;
  domain::PacingSpec pacing_;

  domain::Quantity emitted_{0};
  std::size_t count_{0};

  // VWAP state: normalized curve and the next weight position to consume.
  std::vector<double> weights_;
  std::size_t weight_pos_{0};
  std::chrono::milliseconds last_offset_{0};
};

}  // namespace tradeguard
