#include "tradeguard/config/config_loader.hpp"
#include "tradeguard/domain/error_code.hpp"
#include "tradeguard/domain/to_string.hpp"
#include "tradeguard/risk/risk_config_store.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>

namespace tradeguard {

namespace {

using nlohmann::json;

// Section lookup: nullptr when absent, ConfigError when not an object.
const json* section(const json& root, const char* key) {
  auto it = root.find(key);
  if (it == root.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw domain::ConfigError(std::string("'") + key +
                              "' must be a JSON object");
  }
  return &*it;
}

double readNumber(const json& obj, const char* key, double fallback) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return fallback;
  }
  if (!it->is_number()) {
    throw domain::ConfigError(std::string("'") + key + "' must be a number");
  }
  return it->get<double>();
}

bool readBool(const json& obj, const char* key, bool fallback) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return fallback;
  }
  if (!it->is_boolean()) {
    throw domain::ConfigError(std::string("'") + key + "' must be a boolean");
  }
  return it->get<bool>();
}

std::string readString(const json& obj, const char* key,
                       const std::string& fallback) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw domain::ConfigError(std::string("'") + key + "' must be a string");
  }
  return it->get<std::string>();
}

std::chrono::milliseconds readMillis(const json& obj, const char* key,
                                     std::chrono::milliseconds fallback) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return fallback;
  }
  if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
    throw domain::ConfigError(std::string("'") + key +
                              "' must be a non-negative integer (ms)");
  }
  return std::chrono::milliseconds(it->get<std::int64_t>());
}

domain::Position parsePosition(const json& entry) {
  if (!entry.is_object()) {
    throw domain::ConfigError("account.positions entries must be objects");
  }
  domain::Position pos;
  pos.instrument = readString(entry, "instrument", "");
  if (pos.instrument.empty()) {
    throw domain::ConfigError("account.positions entry needs an 'instrument'");
  }
  auto qty = entry.find("quantity");
  if (qty == entry.end() || !qty->is_number_integer()) {
    throw domain::ConfigError("position '" + pos.instrument +
                              "' needs an integer 'quantity'");
  }
  pos.quantity = qty->get<domain::Quantity>();
  pos.average_cost = readNumber(entry, "average_cost", 0.0);
  pos.realized_pnl = readNumber(entry, "realized_pnl", 0.0);
  if (pos.quantity != 0 && pos.average_cost <= 0.0) {
    throw domain::ConfigError("position '" + pos.instrument +
                              "' needs an 'average_cost' > 0");
  }
  return pos;
}

void validateRetry(const RetryPolicy& retry) {
  if (retry.max_attempts < 1) {
    throw domain::ConfigError("retry.max_attempts must be >= 1");
  }
  if (!std::isfinite(retry.multiplier) || retry.multiplier < 1.0) {
    throw domain::ConfigError("retry.multiplier must be >= 1");
  }
  if (retry.max_backoff < retry.initial_backoff) {
    throw domain::ConfigError(
        "retry.max_backoff_ms must be >= retry.initial_backoff_ms");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parseRiskLimits
// -----------------------------------------------------------------------------
domain::RiskLimitConfig parseRiskLimits(const nlohmann::json& risk,
                                        domain::RiskLimitConfig base) {
  if (!risk.is_object()) {
    throw domain::ConfigError("'risk' must be a JSON object");
  }

  domain::RiskLimitConfig cfg = base;
  cfg.max_position_size =
      readNumber(risk, "max_position_size", cfg.max_position_size);
  cfg.max_loss = readNumber(risk, "max_loss", cfg.max_loss);
  cfg.max_drawdown_percent =
      readNumber(risk, "max_drawdown_percent", cfg.max_drawdown_percent);
  cfg.stop_loss_percent =
      readNumber(risk, "stop_loss_percent", cfg.stop_loss_percent);
  cfg.take_profit_percent =
      readNumber(risk, "take_profit_percent", cfg.take_profit_percent);
  cfg.max_exposure_percent =
      readNumber(risk, "max_exposure_percent", cfg.max_exposure_percent);
  cfg.max_risk_percent =
      readNumber(risk, "max_risk_percent", cfg.max_risk_percent);
  cfg.assumed_volatility_percent = readNumber(
      risk, "assumed_volatility_percent", cfg.assumed_volatility_percent);
  cfg.escalate_alerts_to_halt =
      readBool(risk, "escalate_alerts_to_halt", cfg.escalate_alerts_to_halt);

  if (risk.contains("stop_loss_action")) {
    std::string text = readString(risk, "stop_loss_action", "");
    auto action = domain::parseStopLossAction(text);
    if (!action) {
      throw domain::ConfigError("unknown stop_loss_action '" + text + "'");
    }
    cfg.stop_loss_action = *action;
  }

  RiskConfigStore::validate(cfg);
  return cfg;
}

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const nlohmann::json& root) {
  if (!root.is_object()) {
    throw domain::ConfigError("configuration root must be a JSON object");
  }

  EngineConfig cfg;

  if (const json* risk = section(root, "risk")) {
    cfg.risk = parseRiskLimits(*risk);
  }

  if (const json* retry = section(root, "retry")) {
    auto attempts = retry->find("max_attempts");
    if (attempts != retry->end()) {
      if (!attempts->is_number_integer()) {
        throw domain::ConfigError("retry.max_attempts must be an integer");
      }
      cfg.retry.max_attempts = attempts->get<int>();
    }
    cfg.retry.initial_backoff = readMillis(*retry, "initial_backoff_ms",
                                           cfg.retry.initial_backoff);
    cfg.retry.multiplier = readNumber(*retry, "multiplier",
                                      cfg.retry.multiplier);
    cfg.retry.max_backoff = readMillis(*retry, "max_backoff_ms",
                                       cfg.retry.max_backoff);
  }
  validateRetry(cfg.retry);

  if (const json* timeouts = section(root, "timeouts")) {
    cfg.venue_timeout = readMillis(*timeouts, "venue_ms", cfg.venue_timeout);
    cfg.fill_timeout = readMillis(*timeouts, "fill_ms", cfg.fill_timeout);
  }

  if (const json* monitor = section(root, "monitor")) {
    cfg.monitor_interval =
        readMillis(*monitor, "interval_ms", cfg.monitor_interval);
    cfg.alert_window =
        readMillis(*monitor, "alert_window_ms", cfg.alert_window);
  }
  if (cfg.monitor_interval.count() <= 0) {
    throw domain::ConfigError("monitor.interval_ms must be > 0");
  }

  auto instruments = root.find("instruments");
  if (instruments != root.end()) {
    if (!instruments->is_array()) {
      throw domain::ConfigError("'instruments' must be an array of strings");
    }
    for (const auto& entry : *instruments) {
      if (!entry.is_string() || entry.get<std::string>().empty()) {
        throw domain::ConfigError(
            "'instruments' must contain non-empty strings");
      }
      cfg.instruments.push_back(entry.get<std::string>());
    }
  }

  if (const json* account = section(root, "account")) {
    cfg.initial_cash = readNumber(*account, "initial_cash", cfg.initial_cash);
    if (!std::isfinite(cfg.initial_cash)) {
      throw domain::ConfigError("account.initial_cash must be finite");
    }
    auto positions = account->find("positions");
    if (positions != account->end()) {
      if (!positions->is_array()) {
        throw domain::ConfigError("account.positions must be an array");
      }
      for (const auto& entry : *positions) {
        cfg.initial_positions.push_back(parsePosition(entry));
      }
    }
  }

  if (const json* network = section(root, "network")) {
    cfg.market_data_endpoint =
        readString(*network, "market_data", cfg.market_data_endpoint);
    cfg.command_endpoint =
        readString(*network, "command", cfg.command_endpoint);
    cfg.telemetry_endpoint =
        readString(*network, "telemetry", cfg.telemetry_endpoint);
  }

  if (const json* sim = section(root, "simulation")) {
    cfg.simulated_fill_price =
        readNumber(*sim, "default_fill_price", cfg.simulated_fill_price);
    if (cfg.simulated_fill_price <= 0.0) {
      throw domain::ConfigError("simulation.default_fill_price must be > 0");
    }
  }

  return cfg;
}

// -----------------------------------------------------------------------------
// loadConfig
// -----------------------------------------------------------------------------
EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw domain::ConfigError("cannot open configuration file '" + path + "'");
  }

  nlohmann::json root;
  try {
    root = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw domain::ConfigError("malformed configuration '" + path +
                              "': " + e.what());
  }

  EngineConfig cfg = parseConfig(root);
  std::cout << "[Config] loaded " << path << ": "
            << cfg.instruments.size() << " instruments, "
            << cfg.initial_positions.size() << " initial positions\n";
  return cfg;
}

}  // namespace tradeguard
