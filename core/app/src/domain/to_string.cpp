#include "tradeguard/domain/to_string.hpp"

#include <algorithm>
#include <cctype>

namespace tradeguard {
namespace domain {

namespace {

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

}  // namespace

const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

const char* toString(SliceStatus status) {
  using S = SliceStatus;
  switch (status) {
    case S::Created:         return "Created";
    case S::Submitted:       return "Submitted";
    case S::PartiallyFilled: return "PartiallyFilled";
    case S::Filled:          return "Filled";
    case S::Canceled:        return "Canceled";
    case S::Rejected:        return "Rejected";
    case S::Failed:          return "Failed";
  }
  return "Unknown";
}

const char* toString(ParentStatus status) {
  using S = ParentStatus;
  switch (status) {
    case S::Working:           return "Working";
    case S::Filled:            return "Filled";
    case S::PartiallyExecuted: return "PartiallyExecuted";
    case S::Canceled:          return "Canceled";
    case S::Failed:            return "Failed";
  }
  return "Unknown";
}

const char* toString(RiskRuleId rule) {
  switch (rule) {
    case RiskRuleId::MaxSize:     return "MaxSize";
    case RiskRuleId::MaxLoss:     return "MaxLoss";
    case RiskRuleId::MaxDrawdown: return "MaxDrawdown";
    case RiskRuleId::StopLoss:    return "StopLoss";
    case RiskRuleId::TakeProfit:  return "TakeProfit";
  }
  return "Unknown";
}

const char* toString(RiskAction action) {
  switch (action) {
    case RiskAction::Reject:        return "Reject";
    case RiskAction::ForceFlatten:  return "ForceFlatten";
    case RiskAction::ClosePosition: return "ClosePosition";
  }
  return "Unknown";
}

const char* toString(AlertSeverity severity) {
  switch (severity) {
    case AlertSeverity::Info:     return "Info";
    case AlertSeverity::Warning:  return "Warning";
    case AlertSeverity::Critical: return "Critical";
  }
  return "Unknown";
}

const char* toString(ErrorCode code) {
  using E = ErrorCode;
  switch (code) {
    case E::None:                return "None";
    case E::InvalidQuantity:     return "InvalidQuantity";
    case E::UnknownInstrument:   return "UnknownInstrument";
    case E::InvalidPacing:       return "InvalidPacing";
    case E::RiskRejected:        return "RiskRejected";
    case E::VenueTransient:      return "VenueTransient";
    case E::VenueRejected:       return "VenueRejected";
    case E::LedgerInconsistency: return "LedgerInconsistency";
    case E::FillTimeout:         return "FillTimeout";
    case E::EngineHalted:        return "EngineHalted";
    case E::NotRunning:          return "NotRunning";
  }
  return "Unknown";
}

const char* toString(StopLossAction action) {
  switch (action) {
    case StopLossAction::Reject:       return "Reject";
    case StopLossAction::ForceFlatten: return "ForceFlatten";
  }
  return "Unknown";
}

const char* pacingName(const PacingSpec& pacing) {
  switch (pacing.index()) {
    case 0: return "TWAP";
    case 1: return "VWAP";
    case 2: return "Iceberg";
    case 3: return "MinSlippage";
    case 4: return "Participation";
  }
  return "Unknown";
}

std::optional<Side> parseSide(const std::string& text) {
  std::string key = upper(text);
  if (key == "BUY") {
    return Side::Buy;
  }
  if (key == "SELL") {
    return Side::Sell;
  }
  return std::nullopt;
}

std::optional<StopLossAction> parseStopLossAction(const std::string& text) {
  std::string key = upper(text);
  if (key == "REJECT") {
    return StopLossAction::Reject;
  }
  if (key == "FORCEFLATTEN" || key == "FORCE_FLATTEN") {
    return StopLossAction::ForceFlatten;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace tradeguard
