// =============================================================================
// risk_rule_engine_test.cpp
// =============================================================================
// Unit tests for tradeguard::RiskRuleEngine.
//
// Validates:
//   - MaxSize: 600 against a limit of 500 is rejected, 500 is not
//   - MaxSize monotonicity: once a size is rejected, every larger size is
//   - MaxLoss and MaxDrawdown read the aggregate, not the order
//   - StopLoss blocks exposure-increasing orders on a losing position but
//     never a reducing one, and reports ForceFlatten when configured
//   - TakeProfit blocks adding to a long or short position whose gain
//     reached the limit, reports ClosePosition, and lets reducing orders
//     through
//   - Every violated rule is reported, not just the first
//   - A limit of 0 disables its rule
//
// The engine is pure over (delta, snapshot, limits), so snapshots are built
// by hand instead of going through a PositionLedger.
// =============================================================================

#include "tradeguard/risk/risk_rule_engine.hpp"

#include <gtest/gtest.h>

#include <string>

using tradeguard::RiskRuleEngine;
using tradeguard::domain::LedgerSnapshot;
using tradeguard::domain::Position;
using tradeguard::domain::ProposedDelta;
using tradeguard::domain::Quantity;
using tradeguard::domain::RiskAction;
using tradeguard::domain::RiskLimitConfig;
using tradeguard::domain::RiskRuleId;
using tradeguard::domain::StopLossAction;

// =============================================================================
// Test fixture: one engine, permissive limits, a flat book worth 100k.
// =============================================================================
class RiskRuleEngineTest : public ::testing::Test {
 protected:
  RiskRuleEngine engine;
  RiskLimitConfig limits;
  LedgerSnapshot snapshot;

  void SetUp() override {
    limits.max_position_size = 500.0;
    limits.max_loss = 1000.0;
    limits.max_drawdown_percent = 10.0;
    limits.stop_loss_percent = 5.0;

    snapshot.aggregate.cash = 100000.0;
    snapshot.aggregate.portfolio_value = 100000.0;
    snapshot.aggregate.peak_portfolio_value = 100000.0;
  }

  static ProposedDelta delta(const std::string& instrument, Quantity qty) {
    ProposedDelta d;
    d.instrument = instrument;
    d.signed_quantity = qty;
    return d;
  }

  // Long 100 AAPL bought at 100, now marked at `mark`.
  void holdAapl(double mark) {
    Position pos;
    pos.instrument = "AAPL";
    pos.quantity = 100;
    pos.average_cost = 100.0;
    pos.mark_price = mark;
    pos.unrealized_pnl = 100.0 * (mark - 100.0);
    snapshot.positions = {pos};
  }
};

// -----------------------------------------------------------------------------
// 1. Buying 600 against a 500 limit is rejected with one MaxSize violation.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, MaxSizeRejectsOversizedOrder) {
  auto decision = engine.evaluate(delta("AAPL", 600), snapshot, limits);

  ASSERT_FALSE(decision.accepted());
  ASSERT_EQ(decision.violations.size(), 1u);
  EXPECT_EQ(decision.violations[0].rule, RiskRuleId::MaxSize);
  EXPECT_EQ(decision.violations[0].action, RiskAction::Reject);
  EXPECT_DOUBLE_EQ(decision.violations[0].observed, 600.0);
  EXPECT_DOUBLE_EQ(decision.violations[0].limit, 500.0);
  EXPECT_FALSE(decision.violations[0].message.empty());
}

// -----------------------------------------------------------------------------
// 2. Exactly at the limit is allowed, on either side.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, MaxSizeAllowsExactLimit) {
  EXPECT_TRUE(engine.evaluate(delta("AAPL", 500), snapshot, limits).accepted());
  EXPECT_TRUE(
      engine.evaluate(delta("AAPL", -500), snapshot, limits).accepted());
}

// -----------------------------------------------------------------------------
// 3. MaxSize is monotone in the order size.
// Why: If a bigger order could pass where a smaller one failed, splitting
//      logic upstream could be gamed into a breach.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, MaxSizeIsMonotone) {
  bool rejected_before = false;
  for (Quantity qty = 1; qty <= 1000; qty += 7) {
    bool rejected = engine.evaluate(delta("AAPL", qty), snapshot, limits)
                        .violates(RiskRuleId::MaxSize);
    if (rejected_before) {
      EXPECT_TRUE(rejected) << "qty " << qty << " passed after a rejection";
    }
    rejected_before = rejected_before || rejected;
  }
  EXPECT_TRUE(rejected_before);
}

// -----------------------------------------------------------------------------
// 4. MaxSize uses the resulting position: an order that reduces an
//    oversized holding is allowed.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, MaxSizeConsidersExistingPosition) {
  Position pos;
  pos.instrument = "AAPL";
  pos.quantity = 450;
  pos.average_cost = 100.0;
  snapshot.positions = {pos};

  EXPECT_TRUE(
      engine.evaluate(delta("AAPL", 100), snapshot, limits)
          .violates(RiskRuleId::MaxSize));
  EXPECT_TRUE(engine.evaluate(delta("AAPL", -100), snapshot, limits)
                  .accepted());
  // A different instrument starts flat.
  EXPECT_TRUE(engine.evaluate(delta("MSFT", 100), snapshot, limits)
                  .accepted());
}

// -----------------------------------------------------------------------------
// 5. MaxLoss fires on the session loss regardless of the order.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, MaxLossUsesSessionPnl) {
  snapshot.aggregate.session_pnl = -1500.0;

  auto decision = engine.evaluate(delta("MSFT", 1), snapshot, limits);

  ASSERT_TRUE(decision.violates(RiskRuleId::MaxLoss));
  EXPECT_DOUBLE_EQ(decision.violations[0].observed, 1500.0);
}

// -----------------------------------------------------------------------------
// 6. MaxDrawdown fires once value falls more than the limit below peak.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, MaxDrawdownComparesAgainstPeak) {
  snapshot.aggregate.portfolio_value = 91000.0;  // 9 % below
  EXPECT_FALSE(engine.evaluate(delta("AAPL", 1), snapshot, limits)
                   .violates(RiskRuleId::MaxDrawdown));

  snapshot.aggregate.portfolio_value = 88000.0;  // 12 % below
  auto decision = engine.evaluate(delta("AAPL", 1), snapshot, limits);
  ASSERT_TRUE(decision.violates(RiskRuleId::MaxDrawdown));
  EXPECT_NEAR(decision.violations[0].observed, 12.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 7. StopLoss blocks adding to a position that is down more than the limit,
//    but allows reducing it.
// Why: Blocking the exit would trap the book in the losing position.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, StopLossBlocksAddingButAllowsReducing) {
  holdAapl(90.0);  // 10 % under water

  auto add = engine.evaluate(delta("AAPL", 10), snapshot, limits);
  ASSERT_TRUE(add.violates(RiskRuleId::StopLoss));

  EXPECT_TRUE(engine.evaluate(delta("AAPL", -50), snapshot, limits)
                  .accepted());
  EXPECT_TRUE(engine.evaluate(delta("AAPL", -100), snapshot, limits)
                  .accepted());
}

// -----------------------------------------------------------------------------
// 8. StopLoss reports ForceFlatten when configured that way.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, StopLossForceFlattenAction) {
  holdAapl(90.0);
  limits.stop_loss_action = StopLossAction::ForceFlatten;

  auto decision = engine.evaluate(delta("AAPL", 10), snapshot, limits);

  ASSERT_EQ(decision.violations.size(), 1u);
  EXPECT_EQ(decision.violations[0].rule, RiskRuleId::StopLoss);
  EXPECT_EQ(decision.violations[0].action, RiskAction::ForceFlatten);
  EXPECT_NEAR(decision.violations[0].observed, 10.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 9. All violated rules are returned together.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, ReportsEveryViolation) {
  holdAapl(90.0);
  snapshot.aggregate.session_pnl = -2000.0;
  snapshot.aggregate.portfolio_value = 80000.0;

  auto decision = engine.evaluate(delta("AAPL", 600), snapshot, limits);

  EXPECT_EQ(decision.violations.size(), 4u);
  EXPECT_TRUE(decision.violates(RiskRuleId::MaxSize));
  EXPECT_TRUE(decision.violates(RiskRuleId::MaxLoss));
  EXPECT_TRUE(decision.violates(RiskRuleId::MaxDrawdown));
  EXPECT_TRUE(decision.violates(RiskRuleId::StopLoss));
}

// -----------------------------------------------------------------------------
// 10. A zero limit disables its rule; every call is counted.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, ZeroLimitDisablesRule) {
  limits.max_position_size = 0.0;
  limits.max_loss = 0.0;
  snapshot.aggregate.session_pnl = -1e9;

  auto before = engine.evaluationCount();
  EXPECT_TRUE(
      engine.evaluate(delta("AAPL", 1000000), snapshot, limits).accepted());
  EXPECT_EQ(engine.evaluationCount(), before + 1);
}

// -----------------------------------------------------------------------------
// 11. TakeProfit: adding to a winner past the limit is refused with
//     ClosePosition; trimming it is not; a smaller gain passes.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, TakeProfitBlocksAddingToWinner) {
  limits.take_profit_percent = 10.0;
  holdAapl(115.0);  // +15%

  auto add = engine.evaluate(delta("AAPL", 50), snapshot, limits);
  ASSERT_EQ(add.violations.size(), 1u);
  EXPECT_EQ(add.violations[0].rule, RiskRuleId::TakeProfit);
  EXPECT_EQ(add.violations[0].action, RiskAction::ClosePosition);
  EXPECT_DOUBLE_EQ(add.violations[0].observed, 15.0);
  EXPECT_DOUBLE_EQ(add.violations[0].limit, 10.0);

  EXPECT_TRUE(engine.evaluate(delta("AAPL", -50), snapshot, limits).accepted());
  EXPECT_TRUE(engine.evaluate(delta("MSFT", 50), snapshot, limits).accepted());

  holdAapl(105.0);  // +5%
  EXPECT_TRUE(engine.evaluate(delta("AAPL", 50), snapshot, limits).accepted());
}

// -----------------------------------------------------------------------------
// 12. TakeProfit on a short position, and disabled at 0.
// -----------------------------------------------------------------------------
TEST_F(RiskRuleEngineTest, TakeProfitCoversShortsAndCanBeDisabled) {
  Position short_aapl;
  short_aapl.instrument = "AAPL";
  short_aapl.quantity = -100;
  short_aapl.average_cost = 100.0;
  short_aapl.mark_price = 85.0;
  short_aapl.unrealized_pnl = 1500.0;
  snapshot.positions = {short_aapl};

  limits.take_profit_percent = 12.0;
  auto add = engine.evaluate(delta("AAPL", -20), snapshot, limits);
  EXPECT_TRUE(add.violates(RiskRuleId::TakeProfit));
  EXPECT_TRUE(engine.evaluate(delta("AAPL", 20), snapshot, limits).accepted());

  limits.take_profit_percent = 0.0;
  EXPECT_TRUE(engine.evaluate(delta("AAPL", -20), snapshot, limits).accepted());
}
