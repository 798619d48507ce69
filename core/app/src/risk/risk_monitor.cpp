#include "tradeguard/risk/risk_monitor.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <vector>

namespace tradeguard {

namespace {

std::string crossingMessage(const char* metric, double value,
                            double threshold) {
  std::ostringstream msg;
  msg << metric << " " << value << " crossed above " << threshold;
  return msg.str();
}

}  // namespace

RiskMonitor::RiskMonitor(const PositionLedger& ledger,
                         const RiskConfigStore& config, AlertLog& alerts,
                         const ITimeProvider& clock,
                         std::chrono::milliseconds interval,
                         std::chrono::milliseconds alert_window,
                         EscalationHandler on_escalate)
    : ledger_(ledger),
      config_(config),
      alerts_(alerts),
      clock_(clock),
      interval_(interval),
      alert_window_(alert_window),
      on_escalate_(std::move(on_escalate)) {}

RiskMonitor::~RiskMonitor() { stop(); }

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void RiskMonitor::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[RiskMonitor] started, interval=" << interval_.count()
            << "ms\n";
}

void RiskMonitor::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(stop_mutex_);
    running_.store(false);
  }
  stop_cv_.notify_all();
  thread_.join();
  std::cout << "[RiskMonitor] stopped after " << ticks_.load() << " ticks\n";
}

void RiskMonitor::run() {
  while (running_.load()) {
    tick();

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
  }
}

// -----------------------------------------------------------------------------
// compute: metrics from one ledger snapshot
// -----------------------------------------------------------------------------
domain::RiskSnapshot RiskMonitor::compute(
    const domain::LedgerSnapshot& ledger,
    const domain::RiskLimitConfig& limits) {
  const domain::AggregatePosition& agg = ledger.aggregate;
  domain::RiskSnapshot snap;
  snap.portfolio_value = agg.portfolio_value;

  if (agg.portfolio_value > 0.0) {
    double stop_distance = limits.stop_loss_percent > 0.0
                               ? limits.stop_loss_percent
                               : limits.assumed_volatility_percent;
    snap.exposure_percent = agg.gross_exposure / agg.portfolio_value * 100.0;
    snap.risk_percent =
        agg.gross_exposure * stop_distance / agg.portfolio_value;
  }

  if (agg.peak_portfolio_value > 0.0 &&
      agg.portfolio_value < agg.peak_portfolio_value) {
    snap.drawdown_percent = (agg.peak_portfolio_value - agg.portfolio_value) /
                            agg.peak_portfolio_value * 100.0;
  }

  snap.session_loss = std::max(0.0, -agg.session_pnl);

  auto breached = [&snap](const char* name, double value, double threshold) {
    if (threshold > 0.0 && value > threshold) {
      snap.breached.emplace_back(name);
    }
  };
  breached("exposure_percent", snap.exposure_percent,
           limits.max_exposure_percent);
  breached("risk_percent", snap.risk_percent, limits.max_risk_percent);
  breached("drawdown_percent", snap.drawdown_percent,
           limits.max_drawdown_percent);
  breached("session_loss", snap.session_loss, limits.max_loss);
  return snap;
}

// -----------------------------------------------------------------------------
// tick: snapshot, compute, edge-detect, alert, escalate
// -----------------------------------------------------------------------------
domain::RiskSnapshot RiskMonitor::tick() {
  std::vector<domain::Alert> raised;
  domain::RiskSnapshot snap;
  bool escalate = false;

  {
    std::lock_guard lock(tick_mutex_);
    auto limits = config_.current();
    snap = compute(ledger_.snapshot(), *limits);
    escalate = limits->escalate_alerts_to_halt;

    if (exposure_detector_.update(snap.exposure_percent,
                                  limits->max_exposure_percent)) {
      raised.push_back(alerts_.raise(
          domain::AlertSeverity::Warning, "exposure_percent",
          crossingMessage("exposure_percent", snap.exposure_percent,
                          limits->max_exposure_percent),
          snap.exposure_percent, limits->max_exposure_percent));
    }
    if (risk_detector_.update(snap.risk_percent, limits->max_risk_percent)) {
      raised.push_back(alerts_.raise(
          domain::AlertSeverity::Warning, "risk_percent",
          crossingMessage("risk_percent", snap.risk_percent,
                          limits->max_risk_percent),
          snap.risk_percent, limits->max_risk_percent));
    }
    if (drawdown_detector_.update(snap.drawdown_percent,
                                  limits->max_drawdown_percent)) {
      raised.push_back(alerts_.raise(
          domain::AlertSeverity::Critical, "drawdown_percent",
          crossingMessage("drawdown_percent", snap.drawdown_percent,
                          limits->max_drawdown_percent),
          snap.drawdown_percent, limits->max_drawdown_percent));
    }
    if (loss_detector_.update(snap.session_loss, limits->max_loss)) {
      raised.push_back(alerts_.raise(
          domain::AlertSeverity::Critical, "session_loss",
          crossingMessage("session_loss", snap.session_loss,
                          limits->max_loss),
          snap.session_loss, limits->max_loss));
    }

    snap.alerts_in_window = alerts_.countInWindow(alert_window_);
    snap.timestamp = clock_.now();

    {
      std::lock_guard latest_lock(latest_mutex_);
      latest_ = snap;
    }
    ++ticks_;
  }

  if (escalate && on_escalate_) {
    for (const auto& alert : raised) {
      std::cerr << "[RiskMonitor] escalating alert #" << alert.id
                << " to halt\n";
      on_escalate_(alert);
    }
  }
  return snap;
}

domain::RiskSnapshot RiskMonitor::latest() const {
  std::lock_guard lock(latest_mutex_);
  return latest_;
}

void RiskMonitor::resetDetectors() {
  std::lock_guard lock(tick_mutex_);
  exposure_detector_.reset();
  risk_detector_.reset();
  drawdown_detector_.reset();
  loss_detector_.reset();
}

}  // namespace tradeguard
