#pragma once

#include "tradeguard/domain/position.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IReconciler — start-up reconciliation with the external durable store
// -----------------------------------------------------------------------------
//
// @brief  Narrow read interface to whatever holds positions and cash across
//         sessions (broker account, journal, database).
//
// @details
// The engine may start while the account already holds positions from a
// previous session or a manual trade. TradingEngine::start() asks the
// reconciler for that state and hydrates the PositionLedger with it before
// any order flow or market data is processed, then starts a fresh risk
// session from the hydrated state.
//
// Calling convention:
//   Both methods are called exactly once, synchronously, on the thread that
//   calls TradingEngine::start(), before any worker thread is spawned. They
//   must return promptly.
//
// Ownership:
//   TradingEngine does NOT own the reconciler. It receives a non-owning
//   pointer in start() and uses it only during warm-up.
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  // -------------------------------------------------------------------------
  // reconcilePositions()
  // -------------------------------------------------------------------------
  // @return One entry per instrument held. Quantity, average cost and
  //         realized PnL are taken as authoritative; an empty vector means
  //         the account is flat.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::Position> reconcilePositions() = 0;

  // -------------------------------------------------------------------------
  // reconcileCash()
  // -------------------------------------------------------------------------
  // @return The account's cash balance, or std::nullopt to keep the
  //         configured initial cash.
  // -------------------------------------------------------------------------
  virtual std::optional<double> reconcileCash() = 0;
};

// -----------------------------------------------------------------------------
// StaticReconciler — reconciler backed by fixed values
// -----------------------------------------------------------------------------
// Serves the initial positions and cash from the configuration file in
// paper mode, and canned state in tests.
// -----------------------------------------------------------------------------
class StaticReconciler : public IReconciler {
 public:
  StaticReconciler() = default;

  StaticReconciler(std::vector<domain::Position> positions,
                   std::optional<double> cash)
      : positions_(std::move(positions)), cash_(cash) {}

  std::vector<domain::Position> reconcilePositions() override {
    return positions_;
  }

  std::optional<double> reconcileCash() override { return cash_; }

 private:
  std::vector<domain::Position> positions_;
  std::optional<double> cash_;
};

}  // namespace tradeguard
