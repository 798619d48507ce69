// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for loadConfig() / parseConfig() / parseRiskLimits() and the
// RiskConfigStore they feed.
//
// Validates:
//   - A complete document populates every EngineConfig field
//   - Missing sections keep the defaults
//   - Wrong types and out-of-range values raise ConfigError
//   - parseRiskLimits() overlays only the keys it is given
//   - loadConfig() reports unreadable and malformed files as ConfigError
//   - RiskConfigStore::replace() keeps the old limits when validation fails
// =============================================================================

#include "tradeguard/config/config_loader.hpp"
#include "tradeguard/domain/error_code.hpp"
#include "tradeguard/risk/risk_config_store.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using nlohmann::json;
using tradeguard::parseConfig;
using tradeguard::parseRiskLimits;
using tradeguard::domain::ConfigError;
using tradeguard::domain::RiskLimitConfig;
using tradeguard::domain::StopLossAction;
using std::chrono::milliseconds;

// =============================================================================
// Test fixture: a scratch file under the system temp directory.
// =============================================================================
class ConfigLoaderTest : public ::testing::Test {
 protected:
  std::filesystem::path scratch;

  void SetUp() override {
    scratch = std::filesystem::temp_directory_path() /
              ("tradeguard_config_test_" +
               std::string(::testing::UnitTest::GetInstance()
                               ->current_test_info()
                               ->name()) +
               ".json");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(scratch, ec);
  }

  void writeScratch(const std::string& text) {
    std::ofstream out(scratch);
    out << text;
  }
};

// -----------------------------------------------------------------------------
// 1. Every section is read into its field.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ParsesCompleteDocument) {
  json doc = R"({
    "risk": { "max_position_size": 500, "max_loss": 2500,
              "max_drawdown_percent": 8, "stop_loss_percent": 4,
              "stop_loss_action": "ForceFlatten", "take_profit_percent": 12,
              "max_exposure_percent": 40, "max_risk_percent": 1.5,
              "assumed_volatility_percent": 3,
              "escalate_alerts_to_halt": true },
    "retry": { "max_attempts": 5, "initial_backoff_ms": 20,
               "multiplier": 3.0, "max_backoff_ms": 500 },
    "timeouts": { "venue_ms": 750, "fill_ms": 9000 },
    "monitor": { "interval_ms": 250, "alert_window_ms": 60000 },
    "instruments": ["AAPL", "MSFT"],
    "account": { "initial_cash": 250000,
                 "positions": [ { "instrument": "AAPL", "quantity": -40,
                                  "average_cost": 151.5 } ] },
    "network": { "market_data": "tcp://127.0.0.1:6000",
                 "command": "tcp://*:6001", "telemetry": "tcp://*:6002" },
    "simulation": { "default_fill_price": 42.0 }
  })"_json;

  auto cfg = parseConfig(doc);

  EXPECT_DOUBLE_EQ(cfg.risk.max_position_size, 500.0);
  EXPECT_DOUBLE_EQ(cfg.risk.max_loss, 2500.0);
  EXPECT_DOUBLE_EQ(cfg.risk.max_drawdown_percent, 8.0);
  EXPECT_DOUBLE_EQ(cfg.risk.stop_loss_percent, 4.0);
  EXPECT_EQ(cfg.risk.stop_loss_action, StopLossAction::ForceFlatten);
  EXPECT_DOUBLE_EQ(cfg.risk.take_profit_percent, 12.0);
  EXPECT_DOUBLE_EQ(cfg.risk.max_exposure_percent, 40.0);
  EXPECT_DOUBLE_EQ(cfg.risk.max_risk_percent, 1.5);
  EXPECT_DOUBLE_EQ(cfg.risk.assumed_volatility_percent, 3.0);
  EXPECT_TRUE(cfg.risk.escalate_alerts_to_halt);

  EXPECT_EQ(cfg.retry.max_attempts, 5);
  EXPECT_EQ(cfg.retry.initial_backoff, milliseconds(20));
  EXPECT_DOUBLE_EQ(cfg.retry.multiplier, 3.0);
  EXPECT_EQ(cfg.retry.max_backoff, milliseconds(500));

  EXPECT_EQ(cfg.venue_timeout, milliseconds(750));
  EXPECT_EQ(cfg.fill_timeout, milliseconds(9000));
  EXPECT_EQ(cfg.monitor_interval, milliseconds(250));
  EXPECT_EQ(cfg.alert_window, milliseconds(60000));

  ASSERT_EQ(cfg.instruments.size(), 2u);
  EXPECT_EQ(cfg.instruments[1], "MSFT");

  EXPECT_DOUBLE_EQ(cfg.initial_cash, 250000.0);
  ASSERT_EQ(cfg.initial_positions.size(), 1u);
  EXPECT_EQ(cfg.initial_positions[0].quantity, -40);
  EXPECT_DOUBLE_EQ(cfg.initial_positions[0].average_cost, 151.5);

  EXPECT_EQ(cfg.market_data_endpoint, "tcp://127.0.0.1:6000");
  EXPECT_EQ(cfg.command_endpoint, "tcp://*:6001");
  EXPECT_EQ(cfg.telemetry_endpoint, "tcp://*:6002");
  EXPECT_DOUBLE_EQ(cfg.simulated_fill_price, 42.0);
}

// -----------------------------------------------------------------------------
// 2. An empty document gives the defaults, with every socket disabled.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, EmptyDocumentKeepsDefaults) {
  auto cfg = parseConfig(json::object());
  tradeguard::EngineConfig defaults;

  EXPECT_DOUBLE_EQ(cfg.risk.max_position_size,
                   defaults.risk.max_position_size);
  EXPECT_EQ(cfg.retry.max_attempts, defaults.retry.max_attempts);
  EXPECT_EQ(cfg.fill_timeout, defaults.fill_timeout);
  EXPECT_TRUE(cfg.instruments.empty());
  EXPECT_TRUE(cfg.market_data_endpoint.empty());
  EXPECT_TRUE(cfg.command_endpoint.empty());
  EXPECT_TRUE(cfg.telemetry_endpoint.empty());
}

// -----------------------------------------------------------------------------
// 3. Type and range errors are ConfigError, never a nlohmann exception.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, RejectsInvalidValues) {
  EXPECT_THROW(parseConfig(json::array()), ConfigError);
  EXPECT_THROW(parseConfig(R"({"risk": 5})"_json), ConfigError);
  EXPECT_THROW(parseConfig(R"({"risk": {"max_loss": "lots"}})"_json),
               ConfigError);
  EXPECT_THROW(parseConfig(R"({"risk": {"max_loss": -1}})"_json),
               ConfigError);
  EXPECT_THROW(
      parseConfig(R"({"risk": {"max_drawdown_percent": 150}})"_json),
      ConfigError);
  EXPECT_THROW(
      parseConfig(R"({"risk": {"stop_loss_action": "Panic"}})"_json),
      ConfigError);
  EXPECT_THROW(
      parseConfig(R"({"risk": {"take_profit_percent": -2}})"_json),
      ConfigError);
  EXPECT_THROW(parseConfig(R"({"retry": {"max_attempts": 0}})"_json),
               ConfigError);
  EXPECT_THROW(parseConfig(R"({"retry": {"initial_backoff_ms": 2000,
                                         "max_backoff_ms": 100}})"_json),
               ConfigError);
  EXPECT_THROW(parseConfig(R"({"timeouts": {"fill_ms": -5}})"_json),
               ConfigError);
  EXPECT_THROW(parseConfig(R"({"monitor": {"interval_ms": 0}})"_json),
               ConfigError);
  EXPECT_THROW(parseConfig(R"({"instruments": "AAPL"})"_json), ConfigError);
  EXPECT_THROW(parseConfig(R"({"account": {"positions": [
                   {"instrument": "AAPL", "quantity": 10}]}})"_json),
               ConfigError);
  EXPECT_THROW(
      parseConfig(R"({"simulation": {"default_fill_price": 0}})"_json),
      ConfigError);
}

// -----------------------------------------------------------------------------
// 4. parseRiskLimits() changes only what it is given.
// Why: A RECONFIGURE request names the limits it changes; the rest of the
//      live configuration must survive untouched.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, RiskLimitsOverlayBase) {
  RiskLimitConfig base;
  base.max_position_size = 750.0;
  base.max_loss = 1234.0;

  auto next = parseRiskLimits(R"({"max_loss": 99})"_json, base);

  EXPECT_DOUBLE_EQ(next.max_loss, 99.0);
  EXPECT_DOUBLE_EQ(next.max_position_size, 750.0);
  EXPECT_EQ(next.stop_loss_action, base.stop_loss_action);
}

// -----------------------------------------------------------------------------
// 5. loadConfig(): missing file, malformed JSON, then a good file.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadsFromFile) {
  EXPECT_THROW(tradeguard::loadConfig(scratch.string()), ConfigError);

  writeScratch("{ \"risk\": { \"max_loss\": ");
  EXPECT_THROW(tradeguard::loadConfig(scratch.string()), ConfigError);

  writeScratch(R"({ "instruments": ["ESZ4"], "risk": { "max_loss": 10 } })");
  auto cfg = tradeguard::loadConfig(scratch.string());
  ASSERT_EQ(cfg.instruments.size(), 1u);
  EXPECT_EQ(cfg.instruments[0], "ESZ4");
  EXPECT_DOUBLE_EQ(cfg.risk.max_loss, 10.0);
}

// -----------------------------------------------------------------------------
// 6. A rejected replace() leaves the store on its previous version.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, StoreKeepsLimitsOnInvalidReplace) {
  RiskLimitConfig initial;
  initial.max_loss = 500.0;
  tradeguard::RiskConfigStore store(initial);
  auto held = store.current();
  const auto version = store.version();

  RiskLimitConfig bad = initial;
  bad.stop_loss_percent = -3.0;
  EXPECT_THROW(store.replace(bad), ConfigError);
  EXPECT_EQ(store.version(), version);
  EXPECT_DOUBLE_EQ(store.current()->max_loss, 500.0);

  RiskLimitConfig good = initial;
  good.max_loss = 800.0;
  store.replace(good);
  EXPECT_EQ(store.version(), version + 1);
  EXPECT_DOUBLE_EQ(store.current()->max_loss, 800.0);
  // A snapshot taken earlier is unaffected.
  EXPECT_DOUBLE_EQ(held->max_loss, 500.0);

  EXPECT_THROW(tradeguard::RiskConfigStore{bad}, ConfigError);
}
