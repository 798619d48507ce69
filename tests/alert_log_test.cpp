// =============================================================================
// alert_log_test.cpp
// =============================================================================
// Unit tests for tradeguard::AlertLog.
//
// Validates:
//   - raise() assigns increasing ids, stamps the clock time and publishes
//     an AlertEvent
//   - recent() returns the newest alerts in raise order
//   - countInWindow() only counts alerts inside the sliding window
//   - bySeverity() filters by severity and keeps raise order
// =============================================================================

#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/events/alert_event.hpp"
#include "tradeguard/risk/alert_log.hpp"
#include "tradeguard/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using tradeguard::domain::Alert;
using tradeguard::domain::AlertSeverity;
using std::chrono::milliseconds;

// =============================================================================
// Test fixture: log on a simulated clock, collecting published alerts.
// =============================================================================
class AlertLogTest : public ::testing::Test {
 protected:
  tradeguard::SimulationTimeProvider clock{1700000000000};
  tradeguard::EventBus bus;
  tradeguard::AlertLog alert_log{bus, clock};
  std::vector<Alert> published;

  void SetUp() override {
    bus.subscribe<tradeguard::AlertEvent>(
        [this](const tradeguard::AlertEvent& e) {
          published.push_back(e.alert);
        });
  }
};

// -----------------------------------------------------------------------------
// 1. raise() stamps, stores and publishes.
// -----------------------------------------------------------------------------
TEST_F(AlertLogTest, RaiseStoresAndPublishes) {
  auto first = alert_log.raise(AlertSeverity::Warning, "exposure_percent",
                               "exposure_percent crossed 50", 55.0, 50.0);
  clock.advance_by(10);
  auto second =
      alert_log.raise(AlertSeverity::Critical, "engine_halted", "halt");

  EXPECT_EQ(first.id + 1, second.id);
  EXPECT_EQ(first.timestamp, tradeguard::ms_to_timestamp(1700000000000));
  EXPECT_EQ(second.timestamp, tradeguard::ms_to_timestamp(1700000000010));
  EXPECT_DOUBLE_EQ(first.value, 55.0);
  EXPECT_DOUBLE_EQ(second.threshold, 0.0);

  ASSERT_EQ(alert_log.size(), 2u);
  ASSERT_EQ(published.size(), 2u);
  EXPECT_EQ(published[1].source, "engine_halted");
  EXPECT_EQ(published[1].severity, AlertSeverity::Critical);
}

// -----------------------------------------------------------------------------
// 2. recent(n) keeps the last n, oldest first.
// -----------------------------------------------------------------------------
TEST_F(AlertLogTest, RecentReturnsNewest) {
  for (int i = 0; i < 5; ++i) {
    alert_log.raise(AlertSeverity::Info, "src" + std::to_string(i), "m");
  }

  auto last_two = alert_log.recent(2);
  ASSERT_EQ(last_two.size(), 2u);
  EXPECT_EQ(last_two[0].source, "src3");
  EXPECT_EQ(last_two[1].source, "src4");

  EXPECT_EQ(alert_log.recent(50).size(), 5u);
}

// -----------------------------------------------------------------------------
// 3. The window slides with the clock.
// -----------------------------------------------------------------------------
TEST_F(AlertLogTest, CountInWindowSlides) {
  alert_log.raise(AlertSeverity::Warning, "a", "m");
  clock.advance_by(30000);
  alert_log.raise(AlertSeverity::Warning, "b", "m");
  clock.advance_by(30000);
  alert_log.raise(AlertSeverity::Warning, "c", "m");

  EXPECT_EQ(alert_log.countInWindow(milliseconds(60000)), 3u);
  EXPECT_EQ(alert_log.countInWindow(milliseconds(45000)), 2u);
  EXPECT_EQ(alert_log.countInWindow(milliseconds(1)), 1u);

  clock.advance_by(120000);
  EXPECT_EQ(alert_log.countInWindow(milliseconds(60000)), 0u);
  EXPECT_EQ(alert_log.size(), 3u);
}

// -----------------------------------------------------------------------------
// 4. bySeverity() returns only the requested severity, oldest first.
// -----------------------------------------------------------------------------
TEST_F(AlertLogTest, BySeverityFilters) {
  EXPECT_TRUE(alert_log.bySeverity(AlertSeverity::Critical).empty());

  alert_log.raise(AlertSeverity::Warning, "exposure_percent", "w1");
  alert_log.raise(AlertSeverity::Critical, "engine_halted", "c1");
  alert_log.raise(AlertSeverity::Info, "session", "i1");
  alert_log.raise(AlertSeverity::Critical, "ledger_inconsistency", "c2");

  auto critical = alert_log.bySeverity(AlertSeverity::Critical);
  ASSERT_EQ(critical.size(), 2u);
  EXPECT_EQ(critical[0].source, "engine_halted");
  EXPECT_EQ(critical[1].source, "ledger_inconsistency");
  EXPECT_LT(critical[0].id, critical[1].id);

  auto warnings = alert_log.bySeverity(AlertSeverity::Warning);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0].message, "w1");
}
