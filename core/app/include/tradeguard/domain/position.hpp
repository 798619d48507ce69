#pragma once

#include "tradeguard/domain/order_intent.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <string>
#include <vector>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// Position — current holding of one instrument
// -----------------------------------------------------------------------------
// quantity and average_cost change only on confirmed fills. mark_price (and
// with it unrealized_pnl) also moves on market data marks.
// -----------------------------------------------------------------------------
struct Position {
  std::string instrument;
  Quantity quantity{0};          // Signed: +long, -short, 0=flat
  double average_cost{0.0};      // Weighted average entry price
  double realized_pnl{0.0};      // Cumulative, booked on reducing fills
  double unrealized_pnl{0.0};    // quantity * (mark_price - average_cost)
  double mark_price{0.0};        // Last fill or market mark, 0 if never marked

  // Price used to value the position: the mark when one exists, otherwise
  // the entry price.
  double valuationPrice() const {
    return mark_price > 0.0 ? mark_price : average_cost;
  }

  double marketValue() const {
    return static_cast<double>(quantity) * valuationPrice();
  }
};

// -----------------------------------------------------------------------------
// AggregatePosition — portfolio-wide totals derived from all positions
// -----------------------------------------------------------------------------
// portfolio_value = cash + sum(quantity * valuation price).
// peak_portfolio_value is a high-water mark, reset only by
// PositionLedger::resetSession(). session_pnl is realized plus unrealized
// PnL accrued since the session baseline was taken.
// -----------------------------------------------------------------------------
struct AggregatePosition {
  double cash{0.0};
  double gross_exposure{0.0};     // sum(|market value|)
  double net_exposure{0.0};       // sum(market value)
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double portfolio_value{0.0};
  double peak_portfolio_value{0.0};
  double session_pnl{0.0};
};

// -----------------------------------------------------------------------------
// LedgerSnapshot — consistent copy of the whole ledger
// -----------------------------------------------------------------------------
// Produced under a single lock, so positions and aggregate always describe
// the same set of applied fills.
// -----------------------------------------------------------------------------
struct LedgerSnapshot {
  std::vector<Position> positions;
  AggregatePosition aggregate;
  Timestamp taken_at{};

  // Returns the position for the instrument, or a flat one if none exists.
  Position positionFor(const std::string& instrument) const {
    for (const auto& pos : positions) {
      if (pos.instrument == instrument) {
        return pos;
      }
    }
    Position flat;
    flat.instrument = instrument;
    return flat;
  }
};

}  // namespace domain
}  // namespace tradeguard
