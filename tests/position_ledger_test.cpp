// =============================================================================
// position_ledger_test.cpp
// =============================================================================
// Unit tests for tradeguard::PositionLedger.
//
// Validates:
//   - Weighted-average cost on increasing fills
//   - Realized PnL on reducing fills, flat resets average cost
//   - Crossing zero: realize the closed part, open the rest at fill price
//   - Duplicate fill_id is idempotent (Duplicate, nothing changes)
//   - Unknown slice, over-fill and non-positive fills are refused
//   - Cash, marks, peak value and session PnL in the aggregate
//   - Hydration and session reset re-baseline the risk session
//   - Concurrent fills from several threads are all booked exactly once
// =============================================================================

#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/events/position_update_event.hpp"
#include "tradeguard/risk/position_ledger.hpp"
#include "tradeguard/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using tradeguard::LedgerOutcome;
using tradeguard::domain::ChildOrderSlice;
using tradeguard::domain::Fill;
using tradeguard::domain::Position;
using tradeguard::domain::Quantity;
using tradeguard::domain::Side;
using tradeguard::domain::SliceId;

// =============================================================================
// Test fixture: ledger with 100k cash, counting PositionUpdateEvents.
// =============================================================================
class PositionLedgerTest : public ::testing::Test {
 protected:
  tradeguard::EventBus bus;
  tradeguard::SimulationTimeProvider clock{1700000000000};
  tradeguard::PositionLedger ledger{bus, clock, 100000.0};
  std::atomic<int> updates{0};

  void SetUp() override {
    bus.subscribe<tradeguard::PositionUpdateEvent>(
        [this](const tradeguard::PositionUpdateEvent&) { ++updates; });
  }

  void registerSlice(SliceId id, Side side, Quantity qty,
                     const std::string& instrument = "AAPL") {
    ChildOrderSlice slice;
    slice.id = id;
    slice.parent_id = 1;
    slice.instrument = instrument;
    slice.side = side;
    slice.quantity = qty;
    ledger.registerSlice(slice);
  }

  static Fill fill(const std::string& id, SliceId slice, Quantity qty,
                   double price) {
    Fill f;
    f.fill_id = id;
    f.slice_id = slice;
    f.quantity = qty;
    f.price = price;
    return f;
  }
};

// -----------------------------------------------------------------------------
// 1. Two buys: average cost is quantity-weighted, cash is debited.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, WeightedAverageCostOnIncrease) {
  registerSlice(1, Side::Buy, 100);
  registerSlice(2, Side::Buy, 300);

  ASSERT_TRUE(ledger.applyFill(fill("F1", 1, 100, 10.0)).applied());
  auto result = ledger.applyFill(fill("F2", 2, 300, 20.0));
  ASSERT_TRUE(result.applied());

  EXPECT_EQ(result.position.quantity, 400);
  EXPECT_DOUBLE_EQ(result.position.average_cost, 17.5);
  EXPECT_DOUBLE_EQ(result.position.realized_pnl, 0.0);
  EXPECT_DOUBLE_EQ(ledger.aggregate().cash, 100000.0 - 1000.0 - 6000.0);
  EXPECT_EQ(updates.load(), 2);
}

// -----------------------------------------------------------------------------
// 2. Selling part of a long realizes PnL at (price - avg) and keeps avg.
//    Selling the rest goes flat and clears the average cost.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, RealizedPnlOnReduceAndFlat) {
  registerSlice(1, Side::Buy, 100);
  registerSlice(2, Side::Sell, 100);
  ASSERT_TRUE(ledger.applyFill(fill("F1", 1, 100, 50.0)).applied());

  auto partial = ledger.applyFill(fill("F2", 2, 40, 55.0));
  ASSERT_TRUE(partial.applied());
  EXPECT_EQ(partial.position.quantity, 60);
  EXPECT_DOUBLE_EQ(partial.position.average_cost, 50.0);
  EXPECT_DOUBLE_EQ(partial.position.realized_pnl, 200.0);

  auto flat = ledger.applyFill(fill("F3", 2, 60, 45.0));
  ASSERT_TRUE(flat.applied());
  EXPECT_EQ(flat.position.quantity, 0);
  EXPECT_DOUBLE_EQ(flat.position.average_cost, 0.0);
  EXPECT_DOUBLE_EQ(flat.position.realized_pnl, 200.0 - 300.0);
  EXPECT_DOUBLE_EQ(flat.position.unrealized_pnl, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Flip from long 100 to short 50 in one fill.
// Why: The closed 100 must realize against the old cost; the new short
//      opens at the fill price, not at a blended average.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, CrossingZeroOpensAtFillPrice) {
  registerSlice(1, Side::Buy, 100);
  registerSlice(2, Side::Sell, 150);
  ASSERT_TRUE(ledger.applyFill(fill("F1", 1, 100, 10.0)).applied());

  auto result = ledger.applyFill(fill("F2", 2, 150, 12.0));

  ASSERT_TRUE(result.applied());
  EXPECT_EQ(result.position.quantity, -50);
  EXPECT_DOUBLE_EQ(result.position.average_cost, 12.0);
  EXPECT_DOUBLE_EQ(result.position.realized_pnl, 200.0);
}

// -----------------------------------------------------------------------------
// 4. Applying the same fill_id twice changes nothing the second time.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, DuplicateFillIsIdempotent) {
  registerSlice(1, Side::Buy, 100);
  ASSERT_TRUE(ledger.applyFill(fill("F1", 1, 50, 10.0)).applied());
  auto before = ledger.snapshot();

  auto dup = ledger.applyFill(fill("F1", 1, 50, 10.0));

  EXPECT_EQ(dup.outcome, LedgerOutcome::Duplicate);
  EXPECT_EQ(dup.position.quantity, 50);
  auto after = ledger.snapshot();
  EXPECT_EQ(after.positionFor("AAPL").quantity, 50);
  EXPECT_DOUBLE_EQ(after.aggregate.cash, before.aggregate.cash);
  EXPECT_EQ(ledger.appliedFillCount(), 1u);
  EXPECT_EQ(updates.load(), 1);
}

// -----------------------------------------------------------------------------
// 5. Fills the ledger cannot attribute or that exceed the slice are refused
//    and leave every position untouched.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, RefusesInconsistentFills) {
  registerSlice(1, Side::Buy, 100);

  auto unknown = ledger.applyFill(fill("F1", 99, 10, 10.0));
  EXPECT_EQ(unknown.outcome, LedgerOutcome::Inconsistent);
  EXPECT_FALSE(unknown.reason.empty());

  ASSERT_TRUE(ledger.applyFill(fill("F2", 1, 80, 10.0)).applied());
  auto over = ledger.applyFill(fill("F3", 1, 30, 10.0));
  EXPECT_EQ(over.outcome, LedgerOutcome::Inconsistent);

  EXPECT_EQ(ledger.applyFill(fill("F4", 1, 0, 10.0)).outcome,
            LedgerOutcome::Inconsistent);
  EXPECT_EQ(ledger.applyFill(fill("F5", 1, 5, -1.0)).outcome,
            LedgerOutcome::Inconsistent);
  EXPECT_EQ(ledger.applyFill(fill("", 1, 5, 10.0)).outcome,
            LedgerOutcome::Inconsistent);

  EXPECT_EQ(ledger.position("AAPL")->quantity, 80);
  EXPECT_EQ(ledger.appliedFillCount(), 1u);
}

// -----------------------------------------------------------------------------
// 6. Marks drive unrealized PnL, portfolio value and the peak.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, MarksUpdateValueAndPeak) {
  registerSlice(1, Side::Buy, 100);
  ASSERT_TRUE(ledger.applyFill(fill("F1", 1, 100, 100.0)).applied());

  ledger.updateMark("AAPL", 110.0);
  auto up = ledger.aggregate();
  EXPECT_DOUBLE_EQ(up.unrealized_pnl, 1000.0);
  EXPECT_DOUBLE_EQ(up.portfolio_value, 101000.0);
  EXPECT_DOUBLE_EQ(up.peak_portfolio_value, 101000.0);
  EXPECT_DOUBLE_EQ(up.gross_exposure, 11000.0);

  ledger.updateMark("AAPL", 95.0);
  auto down = ledger.aggregate();
  EXPECT_DOUBLE_EQ(down.portfolio_value, 99500.0);
  EXPECT_DOUBLE_EQ(down.peak_portfolio_value, 101000.0);
  EXPECT_DOUBLE_EQ(down.session_pnl, -500.0);

  // Unknown instrument and bad price are ignored.
  ledger.updateMark("MSFT", 50.0);
  ledger.updateMark("AAPL", 0.0);
  EXPECT_FALSE(ledger.position("MSFT").has_value());
  EXPECT_DOUBLE_EQ(ledger.position("AAPL")->mark_price, 95.0);
}

// -----------------------------------------------------------------------------
// 7. Hydration seeds positions and starts the session from that state;
//    resetSession() re-baselines peak and session PnL.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, HydrationAndSessionReset) {
  Position seed;
  seed.instrument = "MSFT";
  seed.quantity = 200;
  seed.average_cost = 300.0;
  seed.realized_pnl = 150.0;
  ledger.hydratePosition(seed);
  ledger.setCash(50000.0);

  auto start = ledger.aggregate();
  EXPECT_DOUBLE_EQ(start.portfolio_value, 50000.0 + 60000.0);
  EXPECT_DOUBLE_EQ(start.session_pnl, 0.0);
  EXPECT_DOUBLE_EQ(start.peak_portfolio_value, 110000.0);

  ledger.updateMark("MSFT", 290.0);
  EXPECT_DOUBLE_EQ(ledger.aggregate().session_pnl, -2000.0);

  ledger.resetSession();
  auto reset = ledger.aggregate();
  EXPECT_DOUBLE_EQ(reset.session_pnl, 0.0);
  EXPECT_DOUBLE_EQ(reset.peak_portfolio_value, reset.portfolio_value);
  EXPECT_EQ(ledger.position("MSFT")->quantity, 200);
}

// -----------------------------------------------------------------------------
// 8. Fills applied concurrently from several threads are each booked once.
// Why: The venue fill thread and late fills from other adapters can race;
//      the ledger is the single serialization point.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ConcurrentFillsAreSerialized) {
  constexpr int kThreads = 4;
  constexpr int kFillsPerThread = 250;
  registerSlice(1, Side::Buy, kThreads * kFillsPerThread);

  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([this, t] {
      for (int i = 0; i < kFillsPerThread; ++i) {
        std::string id = "T" + std::to_string(t) + "-" + std::to_string(i);
        ledger.applyFill(fill(id, 1, 1, 10.0));
        // Every fill is also replayed once; the replay must be a no-op.
        ledger.applyFill(fill(id, 1, 1, 10.0));
      }
    });
  }
  for (auto& w : workers) w.join();

  EXPECT_EQ(ledger.position("AAPL")->quantity, kThreads * kFillsPerThread);
  EXPECT_EQ(ledger.appliedFillCount(),
            static_cast<std::size_t>(kThreads * kFillsPerThread));
  EXPECT_EQ(updates.load(), kThreads * kFillsPerThread);
}
