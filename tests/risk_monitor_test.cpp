// =============================================================================
// risk_monitor_test.cpp
// =============================================================================
// Unit tests for tradeguard::RiskMonitor and ThresholdCrossingDetector.
//
// Validates:
//   - The detector fires on the upward crossing only and re-arms once the
//     value falls back to or below the threshold
//   - tick() over exposures [3, 12, 14, 11, 9] against 10 raises one alert
//   - compute(): exposure, drawdown and session loss, breached metric names
//   - Escalation runs only when escalate_alerts_to_halt is set
//   - resetDetectors() lets a standing breach alert again
//   - The background thread ticks on its interval and stops cleanly
//
// Ticks are driven by hand except in the thread test, so every assertion
// sees a known ledger state.
// =============================================================================

#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/risk/alert_log.hpp"
#include "tradeguard/risk/position_ledger.hpp"
#include "tradeguard/risk/risk_config_store.hpp"
#include "tradeguard/risk/risk_monitor.hpp"
#include "tradeguard/risk/threshold_crossing_detector.hpp"
#include "tradeguard/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using tradeguard::RiskMonitor;
using tradeguard::ThresholdCrossingDetector;
using tradeguard::domain::AlertSeverity;
using tradeguard::domain::LedgerSnapshot;
using tradeguard::domain::Position;
using tradeguard::domain::RiskLimitConfig;
using std::chrono::milliseconds;

namespace {

// Only the exposure metric is armed.
RiskLimitConfig exposureOnly(bool escalate = false) {
  RiskLimitConfig limits;
  limits.max_position_size = 0.0;
  limits.max_loss = 0.0;
  limits.max_drawdown_percent = 0.0;
  limits.stop_loss_percent = 0.0;
  limits.max_exposure_percent = 10.0;
  limits.max_risk_percent = 0.0;
  limits.escalate_alerts_to_halt = escalate;
  return limits;
}

}  // namespace

// =============================================================================
// Test fixture: a ledger holding 10 AAPL at 100 (market value 1000); cash is
// adjusted to place gross exposure at an exact percentage of the book.
// =============================================================================
class RiskMonitorTest : public ::testing::Test {
 protected:
  tradeguard::SimulationTimeProvider clock{1700000000000};
  tradeguard::EventBus bus;
  tradeguard::PositionLedger ledger{bus, clock, 0.0};
  tradeguard::AlertLog alerts{bus, clock};
  tradeguard::RiskConfigStore config{exposureOnly()};

  void SetUp() override {
    Position pos;
    pos.instrument = "AAPL";
    pos.quantity = 10;
    pos.average_cost = 100.0;
    ledger.hydratePosition(pos);
  }

  void setExposure(double percent) {
    ledger.setCash(1000.0 * 100.0 / percent - 1000.0);
  }
};

// -----------------------------------------------------------------------------
// 1. Detector: one event per upward crossing; re-arms at or below.
// -----------------------------------------------------------------------------
TEST(ThresholdCrossingDetectorTest, FiresOncePerCrossing) {
  ThresholdCrossingDetector detector;
  const std::vector<double> series = {3, 12, 14, 10, 11, 9, 15};
  std::vector<bool> fired;
  for (double v : series) {
    fired.push_back(detector.update(v, 10.0));
  }
  EXPECT_EQ(fired, (std::vector<bool>{false, true, false, false, true, false,
                                      true}));

  // A zero threshold never fires and leaves the detector armed.
  ThresholdCrossingDetector disabled;
  EXPECT_FALSE(disabled.update(1e9, 0.0));
  EXPECT_TRUE(disabled.armed());
}

// -----------------------------------------------------------------------------
// 2. Exposure [3, 12, 14, 11, 9] against 10: exactly one Warning alert.
// Why: A breach that persists across ticks must not flood the alert log.
// -----------------------------------------------------------------------------
TEST_F(RiskMonitorTest, SustainedBreachAlertsOnce) {
  RiskMonitor monitor(ledger, config, alerts, clock, milliseconds(10),
                      milliseconds(60000));

  for (double e : {3.0, 12.0, 14.0, 11.0, 9.0}) {
    setExposure(e);
    auto snap = monitor.tick();
    EXPECT_NEAR(snap.exposure_percent, e, 1e-6);
  }

  auto raised = alerts.all();
  ASSERT_EQ(raised.size(), 1u);
  EXPECT_EQ(raised[0].source, "exposure_percent");
  EXPECT_EQ(raised[0].severity, AlertSeverity::Warning);
  EXPECT_NEAR(raised[0].value, 12.0, 1e-6);
  EXPECT_DOUBLE_EQ(raised[0].threshold, 10.0);

  EXPECT_EQ(monitor.tickCount(), 5u);
  EXPECT_NEAR(monitor.latest().exposure_percent, 9.0, 1e-6);
  EXPECT_EQ(monitor.latest().alerts_in_window, 1u);
  EXPECT_TRUE(monitor.latest().breached.empty());
}

// -----------------------------------------------------------------------------
// 3. compute() over a hand-built snapshot.
// -----------------------------------------------------------------------------
TEST_F(RiskMonitorTest, ComputeDerivesMetrics) {
  RiskLimitConfig limits;
  limits.max_exposure_percent = 50.0;
  limits.max_drawdown_percent = 10.0;
  limits.max_loss = 1000.0;
  limits.stop_loss_percent = 5.0;
  limits.max_risk_percent = 2.0;

  LedgerSnapshot snapshot;
  snapshot.aggregate.gross_exposure = 60000.0;
  snapshot.aggregate.portfolio_value = 80000.0;
  snapshot.aggregate.peak_portfolio_value = 100000.0;
  snapshot.aggregate.session_pnl = -1500.0;

  auto snap = RiskMonitor::compute(snapshot, limits);

  EXPECT_DOUBLE_EQ(snap.exposure_percent, 75.0);
  EXPECT_DOUBLE_EQ(snap.risk_percent, 3.75);
  EXPECT_DOUBLE_EQ(snap.drawdown_percent, 20.0);
  EXPECT_DOUBLE_EQ(snap.session_loss, 1500.0);
  EXPECT_EQ(snap.breached,
            (std::vector<std::string>{"exposure_percent", "risk_percent",
                                      "drawdown_percent", "session_loss"}));

  // A non-positive book has no meaningful exposure ratio.
  snapshot.aggregate.portfolio_value = -10.0;
  auto broke = RiskMonitor::compute(snapshot, limits);
  EXPECT_DOUBLE_EQ(broke.exposure_percent, 0.0);
  EXPECT_DOUBLE_EQ(broke.risk_percent, 0.0);
}

// -----------------------------------------------------------------------------
// 4. Escalation is opt-in.
// -----------------------------------------------------------------------------
TEST_F(RiskMonitorTest, EscalatesOnlyWhenConfigured) {
  std::atomic<int> escalations{0};
  auto count = [&escalations](const tradeguard::domain::Alert&) {
    ++escalations;
  };

  {
    RiskMonitor monitor(ledger, config, alerts, clock, milliseconds(10),
                        milliseconds(60000), count);
    setExposure(20.0);
    monitor.tick();
    EXPECT_EQ(escalations.load(), 0);
    EXPECT_EQ(alerts.size(), 1u);
  }

  config.replace(exposureOnly(true));
  {
    RiskMonitor monitor(ledger, config, alerts, clock, milliseconds(10),
                        milliseconds(60000), count);
    monitor.tick();
    EXPECT_EQ(escalations.load(), 1);
  }
}

// -----------------------------------------------------------------------------
// 5. resetDetectors() re-arms: a breach that never cleared alerts again.
// -----------------------------------------------------------------------------
TEST_F(RiskMonitorTest, ResetDetectorsReArms) {
  RiskMonitor monitor(ledger, config, alerts, clock, milliseconds(10),
                      milliseconds(60000));
  setExposure(20.0);
  monitor.tick();
  monitor.tick();
  EXPECT_EQ(alerts.size(), 1u);

  monitor.resetDetectors();
  monitor.tick();
  EXPECT_EQ(alerts.size(), 2u);
}

// -----------------------------------------------------------------------------
// 6. start() ticks on the interval; stop() joins and is idempotent.
// -----------------------------------------------------------------------------
TEST_F(RiskMonitorTest, BackgroundThreadTicks) {
  RiskMonitor monitor(ledger, config, alerts, clock, milliseconds(5),
                      milliseconds(60000));
  monitor.start();
  EXPECT_TRUE(monitor.isRunning());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (monitor.tickCount() < 3 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(2));
  }

  monitor.stop();
  EXPECT_FALSE(monitor.isRunning());
  EXPECT_GE(monitor.tickCount(), 3u);

  auto after = monitor.tickCount();
  std::this_thread::sleep_for(milliseconds(30));
  EXPECT_EQ(monitor.tickCount(), after);
  monitor.stop();
}
