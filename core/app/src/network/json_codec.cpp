#include "tradeguard/network/json_codec.hpp"
#include "tradeguard/domain/to_string.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace tradeguard {

namespace {

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return text;
}

// Signed whole number. A fractional value is refused instead of truncated;
// a non-number is left to nlohmann's type_error.
std::int64_t wholeNumber(const nlohmann::json& j, const char* key) {
  const nlohmann::json& value = j.at(key);
  if (value.is_number_float()) {
    throw std::invalid_argument(std::string(key) +
                                " must be a whole number, got " +
                                value.dump());
  }
  return value.get<std::int64_t>();
}

// Count that must be >= 0. A negative value would wrap when read as size_t.
std::size_t countOr(const nlohmann::json& j, const char* key,
                    std::size_t fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  const nlohmann::json& value = j.at(key);
  if (value.is_number() && !value.is_number_unsigned()) {
    throw std::invalid_argument(std::string(key) +
                                " must be a non-negative whole number, got " +
                                value.dump());
  }
  return value.get<std::size_t>();
}

std::int64_t wholeOr(const nlohmann::json& j, const char* key,
                     std::int64_t fallback) {
  return j.contains(key) ? wholeNumber(j, key) : fallback;
}

std::chrono::milliseconds millisOr(const nlohmann::json& j, const char* key,
                                   std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(wholeOr(j, key, fallback.count()));
}

domain::PacingSpec pacingFromJson(const nlohmann::json& p) {
  std::string algorithm = upper(p.at("algorithm").get<std::string>());

  if (algorithm == "TWAP") {
    domain::TwapParams params;
    params.slices = countOr(p, "slices", params.slices);
    params.horizon = millisOr(p, "horizon_ms", params.horizon);
    return params;
  }
  if (algorithm == "VWAP") {
    domain::VwapParams params;
    params.weights = p.at("weights").get<std::vector<double>>();
    params.horizon = millisOr(p, "horizon_ms", params.horizon);
    return params;
  }
  if (algorithm == "ICEBERG") {
    domain::IcebergParams params;
    params.clip_size = wholeOr(p, "clip_size", params.clip_size);
    params.interval = millisOr(p, "interval_ms", params.interval);
    return params;
  }
  if (algorithm == "MINSLIPPAGE" || algorithm == "MIN_SLIPPAGE") {
    domain::MinSlippageParams params;
    params.clip_size = wholeOr(p, "clip_size", params.clip_size);
    params.interval = millisOr(p, "interval_ms", params.interval);
    params.base_spread_bps = p.value("base_spread_bps", params.base_spread_bps);
    return params;
  }
  if (algorithm == "PARTICIPATION" || algorithm == "PARTICIPATE" ||
      algorithm == "POV") {
    domain::ParticipationParams params;
    params.participation_rate =
        p.value("participation_rate", params.participation_rate);
    params.clip_size = wholeOr(p, "clip_size", params.clip_size);
    params.interval = millisOr(p, "interval_ms", params.interval);
    return params;
  }
  throw std::invalid_argument("unknown pacing algorithm '" +
                              p.at("algorithm").get<std::string>() + "'");
}

}  // namespace

// -----------------------------------------------------------------------------
// Encoders
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Position& position) {
  nlohmann::json j;
  j["instrument"] = position.instrument;
  j["quantity"] = position.quantity;
  j["average_cost"] = position.average_cost;
  j["realized_pnl"] = position.realized_pnl;
  j["unrealized_pnl"] = position.unrealized_pnl;
  j["mark_price"] = position.mark_price;
  return j;
}

nlohmann::json toJson(const domain::AggregatePosition& aggregate) {
  nlohmann::json j;
  j["cash"] = aggregate.cash;
  j["gross_exposure"] = aggregate.gross_exposure;
  j["net_exposure"] = aggregate.net_exposure;
  j["realized_pnl"] = aggregate.realized_pnl;
  j["unrealized_pnl"] = aggregate.unrealized_pnl;
  j["portfolio_value"] = aggregate.portfolio_value;
  j["peak_portfolio_value"] = aggregate.peak_portfolio_value;
  j["session_pnl"] = aggregate.session_pnl;
  return j;
}

nlohmann::json toJson(const domain::ChildOrderSlice& slice) {
  nlohmann::json j;
  j["slice_id"] = slice.id;
  j["parent_id"] = slice.parent_id;
  j["index"] = slice.index;
  j["instrument"] = slice.instrument;
  j["side"] = domain::toString(slice.side);
  j["quantity"] = slice.quantity;
  j["filled_quantity"] = slice.filled_quantity;
  j["status"] = domain::toString(slice.status);
  j["venue_order_id"] = slice.venue_order_id;
  j["attempts"] = slice.submit_attempts;
  if (slice.limit_price) {
    j["limit_price"] = *slice.limit_price;
  }
  return j;
}

nlohmann::json toJson(const domain::RuleViolation& violation) {
  nlohmann::json j;
  j["rule"] = domain::toString(violation.rule);
  j["action"] = domain::toString(violation.action);
  j["observed"] = violation.observed;
  j["limit"] = violation.limit;
  j["message"] = violation.message;
  return j;
}

nlohmann::json toJson(const domain::ParentOrderReport& report) {
  nlohmann::json j;
  j["order_id"] = report.order_id;
  j["instrument"] = report.instrument;
  j["side"] = domain::toString(report.side);
  j["status"] = domain::toString(report.status);
  j["target_quantity"] = report.target_quantity;
  j["scheduled_quantity"] = report.scheduled_quantity;
  j["filled_quantity"] = report.filled_quantity;
  j["slices_submitted"] = report.slices_submitted;
  j["slices_filled"] = report.slices_filled;
  j["halt_reason"] = domain::toString(report.halt_reason);
  j["message"] = report.message;
  j["updated_at_ms"] = timestamp_to_ms(report.updated_at);

  nlohmann::json violations = nlohmann::json::array();
  for (const auto& v : report.violations) {
    violations.push_back(toJson(v));
  }
  j["violations"] = std::move(violations);
  return j;
}

nlohmann::json toJson(const domain::RiskSnapshot& snapshot) {
  nlohmann::json j;
  j["exposure_percent"] = snapshot.exposure_percent;
  j["risk_percent"] = snapshot.risk_percent;
  j["drawdown_percent"] = snapshot.drawdown_percent;
  j["session_loss"] = snapshot.session_loss;
  j["portfolio_value"] = snapshot.portfolio_value;
  j["breached"] = snapshot.breached;
  j["alerts_in_window"] = snapshot.alerts_in_window;
  j["timestamp_ms"] = timestamp_to_ms(snapshot.timestamp);
  return j;
}

nlohmann::json toJson(const domain::Alert& alert) {
  nlohmann::json j;
  j["id"] = alert.id;
  j["severity"] = domain::toString(alert.severity);
  j["source"] = alert.source;
  j["message"] = alert.message;
  j["value"] = alert.value;
  j["threshold"] = alert.threshold;
  j["timestamp_ms"] = timestamp_to_ms(alert.timestamp);
  return j;
}

nlohmann::json toJson(const domain::RiskLimitConfig& limits) {
  nlohmann::json j;
  j["max_position_size"] = limits.max_position_size;
  j["max_loss"] = limits.max_loss;
  j["max_drawdown_percent"] = limits.max_drawdown_percent;
  j["stop_loss_percent"] = limits.stop_loss_percent;
  j["stop_loss_action"] = domain::toString(limits.stop_loss_action);
  j["take_profit_percent"] = limits.take_profit_percent;
  j["max_exposure_percent"] = limits.max_exposure_percent;
  j["max_risk_percent"] = limits.max_risk_percent;
  j["assumed_volatility_percent"] = limits.assumed_volatility_percent;
  j["escalate_alerts_to_halt"] = limits.escalate_alerts_to_halt;
  return j;
}

// -----------------------------------------------------------------------------
// intentFromJson
// -----------------------------------------------------------------------------
domain::OrderIntent intentFromJson(const nlohmann::json& j) {
  domain::OrderIntent intent;
  intent.instrument = j.at("instrument").get<std::string>();

  std::string side = j.at("side").get<std::string>();
  auto parsed = domain::parseSide(side);
  if (!parsed) {
    throw std::invalid_argument("unknown side '" + side + "'");
  }
  intent.side = *parsed;

  intent.quantity = wholeNumber(j, "quantity");

  if (j.contains("limit_price") && !j.at("limit_price").is_null()) {
    intent.limit_price = j.at("limit_price").get<double>();
  }
  if (j.contains("pacing")) {
    intent.pacing = pacingFromJson(j.at("pacing"));
  }
  return intent;
}

}  // namespace tradeguard
