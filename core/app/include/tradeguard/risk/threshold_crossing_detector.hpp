#pragma once

namespace tradeguard {

// -----------------------------------------------------------------------------
// ThresholdCrossingDetector — edge trigger for one monitored metric
// -----------------------------------------------------------------------------
// update() returns true only on the tick where the value first rises above
// the threshold. The detector then stays disarmed while the value remains
// above it, and re-arms once the value falls back to or below it.
//
//   threshold 10, values 3, 12, 14, 11, 9, 15 → fires on 12 and on 15.
//
// A threshold <= 0 disables the metric: nothing fires and the detector
// stays armed.
//
// Not thread-safe; RiskMonitor serializes its ticks.
// -----------------------------------------------------------------------------
class ThresholdCrossingDetector {
 public:
  bool update(double value, double threshold) {
    if (threshold <= 0.0 || value <= threshold) {
      armed_ = true;
      return false;
    }
    if (!armed_) {
      return false;
    }
    armed_ = false;
    return true;
  }

  void reset() { armed_ = true; }

  bool armed() const { return armed_; }

 private:
  bool armed_{true};
};

}  // namespace tradeguard
