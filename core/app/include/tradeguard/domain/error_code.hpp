#pragma once

#include <stdexcept>
#include <string>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// ErrorCode — machine-readable reason codes
// -----------------------------------------------------------------------------
// Synchronous failures (validation, risk) are returned to the caller at
// intake. Asynchronous failures (venue, ledger) end up on the terminal
// ParentOrderReport and, when they affect risk visibility, as an Alert.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  None,
  InvalidQuantity,      // ValidationError: quantity <= 0
  UnknownInstrument,    // ValidationError: instrument not configured
  InvalidPacing,        // ValidationError: malformed pacing parameters
  RiskRejected,         // One or more rule violations
  VenueTransient,       // Retries exhausted on timeouts / rate limits
  VenueRejected,        // Hard venue rejection
  LedgerInconsistency,  // Ledger refused a fill
  FillTimeout,          // Slice not terminal within the fill timeout
  EngineHalted,         // Intake stopped by HALT or alert escalation
  NotRunning,           // Engine not started
};

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown when a configuration source is unreadable or a value is out of
// range. The only exception type the core raises itself; everything on the
// order path reports through ErrorCode instead.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace domain
}  // namespace tradeguard
