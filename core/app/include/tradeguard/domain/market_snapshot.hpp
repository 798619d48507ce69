#pragma once

#include "tradeguard/time/time_utils.hpp"

#include <string>

namespace tradeguard {
namespace domain {

// Latest quote and trade seen for one instrument.
struct MarketSnapshot {
  std::string instrument;
  double bid{0.0};
  double ask{0.0};
  double last{0.0};
  double volume{0.0};  // Size of the last reported trade; 0 when unknown
  Timestamp timestamp{};

  double mid() const {
    if (bid > 0.0 && ask > 0.0) {
      return (bid + ask) / 2.0;
    }
    return last;
  }

  // Quoted spread in basis points of the mid. 0 when either side is missing.
  double spreadBps() const {
    double m = mid();
    if (bid <= 0.0 || ask <= 0.0 || m <= 0.0 || ask < bid) {
      return 0.0;
    }
    return (ask - bid) / m * 10000.0;
  }
};

}  // namespace domain
}  // namespace tradeguard
