// =============================================================================
// slice_sequence_test.cpp
// =============================================================================
// Unit tests for tradeguard::SliceSequence.
//
// Validates:
//   - TWAP: equal slices, remainder on the last, n capped at the quantity
//   - VWAP: weight-proportional sizing, zero-weight buckets skipped
//   - Iceberg: fixed clips with a short last clip
//   - MinSlippage: clip shrinks as the spread widens, never below 1
//   - Participation: a share of the last traded volume, the clip without
//     volume, never below 1
//   - Slice-sum invariant across algorithms and quantities
//   - pendingDelay() agrees with the delay carried by the next instruction
//   - validate() rejects malformed pacing parameters
//
// Pure logic; no threads, no clock.
// =============================================================================

#include "tradeguard/execution/slice_sequence.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using tradeguard::SliceInstruction;
using tradeguard::SliceSequence;
using tradeguard::domain::IcebergParams;
using tradeguard::domain::MarketSnapshot;
using tradeguard::domain::MinSlippageParams;
using tradeguard::domain::PacingSpec;
using tradeguard::domain::ParticipationParams;
using tradeguard::domain::Quantity;
using tradeguard::domain::TwapParams;
using tradeguard::domain::VwapParams;
using std::chrono::milliseconds;

// =============================================================================
// Test fixture: helpers to drain a sequence.
// =============================================================================
class SliceSequenceTest : public ::testing::Test {
 protected:
  static std::vector<SliceInstruction> drain(
      SliceSequence& seq,
      const std::optional<MarketSnapshot>& market = std::nullopt) {
    std::vector<SliceInstruction> out;
    while (auto instr = seq.next(market)) {
      out.push_back(*instr);
      if (out.size() > 10000) {
        break;  // A broken sequence must fail the test, not hang it.
      }
    }
    return out;
  }

  static Quantity sum(const std::vector<SliceInstruction>& slices) {
    Quantity total = 0;
    for (const auto& s : slices) {
      total += s.quantity;
    }
    return total;
  }

  static MarketSnapshot quote(double bid, double ask) {
    MarketSnapshot snap;
    snap.instrument = "AAPL";
    snap.bid = bid;
    snap.ask = ask;
    snap.last = (bid + ask) / 2.0;
    return snap;
  }
};

// -----------------------------------------------------------------------------
// 1. TWAP 1000 over 7 slices: six slices of 142 and a last slice of 148.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, TwapPutsRemainderOnLastSlice) {
  TwapParams p;
  p.slices = 7;
  p.horizon = milliseconds(70000);
  SliceSequence seq(1000, p);

  auto slices = drain(seq);

  ASSERT_EQ(slices.size(), 7u);
  for (std::size_t i = 0; i < 6; ++i) {
    EXPECT_EQ(slices[i].quantity, 142) << "slice " << i;
    EXPECT_EQ(slices[i].index, i);
  }
  EXPECT_EQ(slices[6].quantity, 148);
  EXPECT_EQ(sum(slices), 1000);
  EXPECT_TRUE(seq.exhausted());
}

// -----------------------------------------------------------------------------
// 2. TWAP spacing: first slice immediately, then horizon / n apart.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, TwapSpacesSlicesEvenly) {
  TwapParams p;
  p.slices = 4;
  p.horizon = milliseconds(8000);
  SliceSequence seq(400, p);

  auto slices = drain(seq);

  ASSERT_EQ(slices.size(), 4u);
  EXPECT_EQ(slices[0].delay, milliseconds(0));
  for (std::size_t i = 1; i < slices.size(); ++i) {
    EXPECT_EQ(slices[i].delay, milliseconds(2000));
  }
}

// -----------------------------------------------------------------------------
// 3. TWAP with fewer units than slices: one unit per slice, never zero.
// Why: A zero-quantity child order is meaningless at any venue.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, TwapCapsSliceCountAtQuantity) {
  TwapParams p;
  p.slices = 10;
  SliceSequence seq(3, p);

  auto slices = drain(seq);

  ASSERT_EQ(slices.size(), 3u);
  for (const auto& s : slices) {
    EXPECT_EQ(s.quantity, 1);
  }
}

// -----------------------------------------------------------------------------
// 4. VWAP sizes by normalized weight; the last bucket takes the residual.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, VwapFollowsVolumeCurve) {
  VwapParams p;
  p.weights = {1.0, 2.0, 1.0};
  p.horizon = milliseconds(60000);
  SliceSequence seq(100, p);

  auto slices = drain(seq);

  ASSERT_EQ(slices.size(), 3u);
  EXPECT_EQ(slices[0].quantity, 25);
  EXPECT_EQ(slices[1].quantity, 50);
  EXPECT_EQ(slices[2].quantity, 25);
  EXPECT_EQ(slices[1].delay, milliseconds(20000));
  EXPECT_EQ(slices[2].delay, milliseconds(20000));
}

// -----------------------------------------------------------------------------
// 5. VWAP skips zero-weight buckets and keeps the bucket timing.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, VwapSkipsEmptyBuckets) {
  VwapParams p;
  p.weights = {0.0, 1.0, 0.0, 1.0};
  p.horizon = milliseconds(40000);
  SliceSequence seq(10, p);

  auto slices = drain(seq);

  ASSERT_EQ(slices.size(), 2u);
  EXPECT_EQ(slices[0].quantity, 5);
  EXPECT_EQ(slices[0].delay, milliseconds(0));
  EXPECT_EQ(slices[1].quantity, 5);
  // Bucket 1 → bucket 3 is two steps of 10 s.
  EXPECT_EQ(slices[1].delay, milliseconds(20000));
}

// -----------------------------------------------------------------------------
// 6. Iceberg: fixed clips, short last clip.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, IcebergEmitsFixedClips) {
  IcebergParams p;
  p.clip_size = 100;
  p.interval = milliseconds(500);
  SliceSequence seq(250, p);

  auto slices = drain(seq);

  ASSERT_EQ(slices.size(), 3u);
  EXPECT_EQ(slices[0].quantity, 100);
  EXPECT_EQ(slices[1].quantity, 100);
  EXPECT_EQ(slices[2].quantity, 50);
  EXPECT_EQ(slices[2].delay, milliseconds(500));
}

// -----------------------------------------------------------------------------
// 7. MinSlippage: full clip at or below the base spread, scaled-down clip
//    above it, and a floor of one unit for an extreme spread.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, MinSlippageAdaptsToSpread) {
  MinSlippageParams p;
  p.clip_size = 100;
  p.base_spread_bps = 5.0;

  {
    SliceSequence seq(1000, p);
    auto instr = seq.next(quote(99.99, 100.01));  // ~2 bps
    ASSERT_TRUE(instr.has_value());
    EXPECT_EQ(instr->quantity, 100);
  }
  {
    SliceSequence seq(1000, p);
    auto instr = seq.next(quote(99.95, 100.05));  // ~10 bps
    ASSERT_TRUE(instr.has_value());
    EXPECT_EQ(instr->quantity, 50);
  }
  {
    SliceSequence seq(1000, p);
    auto instr = seq.next(quote(90.0, 110.0));  // 2000 bps
    ASSERT_TRUE(instr.has_value());
    EXPECT_EQ(instr->quantity, 1);
  }
  {
    SliceSequence seq(1000, p);
    auto instr = seq.next(std::nullopt);  // No quote: plain clip
    ASSERT_TRUE(instr.has_value());
    EXPECT_EQ(instr->quantity, 100);
  }
}

// -----------------------------------------------------------------------------
// 8. Slice-sum invariant: every algorithm emits exactly the parent quantity
//    in strictly positive slices.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, SlicesAlwaysSumToTotal) {
  TwapParams twap;
  twap.slices = 6;
  VwapParams vwap;
  vwap.weights = {0.1, 0.3, 0.0, 0.4, 0.2};
  IcebergParams ice;
  ice.clip_size = 37;
  MinSlippageParams minslip;
  minslip.clip_size = 40;
  minslip.base_spread_bps = 3.0;
  ParticipationParams pov;
  pov.participation_rate = 0.25;
  pov.clip_size = 30;

  const std::vector<PacingSpec> pacings = {twap, vwap, ice, minslip, pov};
  const std::vector<Quantity> totals = {1, 5, 99, 1000, 12345};
  const auto wide = quote(99.9, 100.1);

  for (const auto& pacing : pacings) {
    for (Quantity total : totals) {
      SliceSequence seq(total, pacing);
      auto slices = drain(seq, wide);
      EXPECT_EQ(sum(slices), total)
          << "pacing index " << pacing.index() << " total " << total;
      for (const auto& s : slices) {
        EXPECT_GT(s.quantity, 0);
      }
    }
  }
}

// -----------------------------------------------------------------------------
// 9. pendingDelay() predicts the delay of the next instruction, and is zero
//    before the first slice and after exhaustion.
// Why: The parent task waits pendingDelay() BEFORE sizing a MinSlippage
//      slice, so it must agree with what next() would report.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, PendingDelayMatchesNextInstruction) {
  VwapParams p;
  p.weights = {1.0, 0.0, 1.0, 1.0};
  p.horizon = milliseconds(4000);
  SliceSequence seq(30, p);

  EXPECT_EQ(seq.pendingDelay(), milliseconds(0));
  while (!seq.exhausted()) {
    auto expected = seq.pendingDelay();
    auto instr = seq.next();
    ASSERT_TRUE(instr.has_value());
    EXPECT_EQ(instr->delay, expected) << "slice " << instr->index;
  }
  EXPECT_EQ(seq.pendingDelay(), milliseconds(0));
}

// -----------------------------------------------------------------------------
// 10. validate() names the problem for each malformed pacing.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, ValidateRejectsMalformedPacing) {
  TwapParams twap;
  twap.slices = 0;
  EXPECT_TRUE(SliceSequence::validate(twap).has_value());

  VwapParams vwap;
  EXPECT_TRUE(SliceSequence::validate(vwap).has_value());
  vwap.weights = {0.0, 0.0};
  EXPECT_TRUE(SliceSequence::validate(vwap).has_value());
  vwap.weights = {1.0, -1.0};
  EXPECT_TRUE(SliceSequence::validate(vwap).has_value());

  IcebergParams ice;
  ice.clip_size = 0;
  EXPECT_TRUE(SliceSequence::validate(ice).has_value());

  MinSlippageParams minslip;
  minslip.base_spread_bps = 0.0;
  EXPECT_TRUE(SliceSequence::validate(minslip).has_value());

  EXPECT_FALSE(SliceSequence::validate(TwapParams{}).has_value());
  EXPECT_FALSE(SliceSequence::validate(IcebergParams{}).has_value());
  EXPECT_FALSE(SliceSequence::validate(MinSlippageParams{}).has_value());

  ParticipationParams pov;
  pov.participation_rate = 0.0;
  EXPECT_TRUE(SliceSequence::validate(pov).has_value());
  pov.participation_rate = 1.5;
  EXPECT_TRUE(SliceSequence::validate(pov).has_value());
  pov.participation_rate = std::numeric_limits<double>::quiet_NaN();
  EXPECT_TRUE(SliceSequence::validate(pov).has_value());
  pov.participation_rate = 1.0;
  pov.clip_size = 0;
  EXPECT_TRUE(SliceSequence::validate(pov).has_value());
  EXPECT_FALSE(SliceSequence::validate(ParticipationParams{}).has_value());
}

// -----------------------------------------------------------------------------
// 11. A slice count beyond what a quantity can hold is refused, and a
//     sequence built from one anyway still emits the whole parent at once.
// Why: A negative count that wrapped through an unsigned conversion must
//      not turn into a single unpaced slice behind the caller's back.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, TwapSliceCountIsBounded) {
  TwapParams wrapped;
  wrapped.slices = static_cast<std::size_t>(-5);
  wrapped.horizon = milliseconds(1000);
  auto problem = SliceSequence::validate(wrapped);
  ASSERT_TRUE(problem.has_value());
  EXPECT_NE(problem->find("TWAP"), std::string::npos);

  SliceSequence seq(10, wrapped);
  auto slices = drain(seq);
  EXPECT_EQ(slices.size(), 10u);
  EXPECT_EQ(sum(slices), 10);
}

// -----------------------------------------------------------------------------
// 12. Participation: each slice is the configured share of the last traded
//     volume, the clip size when no volume is known, and at least 1.
// -----------------------------------------------------------------------------
TEST_F(SliceSequenceTest, ParticipationTracksVolume) {
  ParticipationParams p;
  p.participation_rate = 0.1;
  p.clip_size = 40;
  p.interval = milliseconds(500);
  SliceSequence seq(250, p);

  MarketSnapshot busy = quote(99.0, 101.0);
  busy.volume = 1000.0;
  MarketSnapshot quiet = quote(99.0, 101.0);
  quiet.volume = 4.0;

  auto first = seq.next(busy);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->quantity, 100);
  EXPECT_EQ(first->delay, milliseconds(0));

  EXPECT_EQ(seq.pendingDelay(), milliseconds(500));
  auto second = seq.next(std::nullopt);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->quantity, 40);
  EXPECT_EQ(second->delay, milliseconds(500));

  auto third = seq.next(quiet);
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->quantity, 1);

  auto rest = drain(seq, busy);
  ASSERT_FALSE(rest.empty());
  EXPECT_EQ(rest.back().quantity, 9);
  EXPECT_EQ(100 + 40 + 1 + sum(rest), 250);
  EXPECT_TRUE(seq.exhausted());
}
