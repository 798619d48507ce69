#include "tradeguard/engine/trading_engine.hpp"
#include "tradeguard/config/config_loader.hpp"
#include "tradeguard/domain/to_string.hpp"
#include "tradeguard/execution/slice_sequence.hpp"
#include "tradeguard/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace tradeguard {

namespace {

// Splits "SUBMIT {...}" into verb and argument (argument may be empty).
std::pair<std::string, std::string> splitCommand(const std::string& cmd) {
  const auto space = cmd.find(' ');
  if (space == std::string::npos) {
    return {cmd, std::string{}};
  }
  std::string arg = cmd.substr(space + 1);
  const auto first = arg.find_first_not_of(' ');
  arg = first == std::string::npos ? std::string{} : arg.substr(first);
  return {cmd.substr(0, space), std::move(arg)};
}

constexpr std::chrono::milliseconds kAwaitPollStep{10};

nlohmann::json errorResponse(const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = message;
  return response;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(EngineConfig config, const ITimeProvider& clock,
                             IVenueAdapter* venue)
    : config_(std::move(config)),
      clock_(clock),
      config_store_(config_.risk),
      owned_venue_(venue == nullptr
                       ? std::make_unique<SimulatedVenue>(
                             clock, &market_cache_,
                             config_.simulated_fill_price)
                       : nullptr),
      venue_(venue != nullptr ? *venue : *owned_venue_),
      ledger_(bus_, clock, config_.initial_cash),
      alerts_(bus_, clock) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start(IReconciler* reconciler) {
  std::lock_guard lifecycle_lock(lifecycle_mutex_);
  if (running_.load()) {
    return;
  }

  // ---  1) Synchronization Gate (optional) ----------------------------------
  if (reconciler != nullptr) {
    auto positions = reconciler->reconcilePositions();
    for (const auto& pos : positions) {
      ledger_.hydratePosition(pos);
    }
    auto cash = reconciler->reconcileCash();
    if (cash.has_value()) {
      ledger_.setCash(*cash);
    }

    std::cout << "[TradingEngine] Reconciliation complete: "
              << positions.size() << " position(s) hydrated, cash "
              << (cash.has_value() ? "restored" : "unchanged") << ".\n";
  }
  ledger_.resetSession();

  // ---  2) Notification loop ------------------------------------------------
  notification_loop_.start();

  // ---  3) Lifecycle engine, scheduler and monitor --------------------------
  {
    std::unique_lock state_lock(state_mutex_);
    lifecycle_ = std::make_unique<OrderLifecycleEngine>(
        bus_, venue_, ledger_, alerts_, clock_, config_.retry,
        config_.venue_timeout);

    scheduler_ = std::make_unique<ExecutionScheduler>(
        bus_, *lifecycle_, ledger_, rules_, config_store_, &market_cache_,
        slice_ids_, clock_, config_.fill_timeout,
        [this](domain::ErrorCode code, const std::string& why) {
          halt(std::string(domain::toString(code)) + ": " + why);
        });

    monitor_ = std::make_unique<RiskMonitor>(
        ledger_, config_store_, alerts_, clock_, config_.monitor_interval,
        config_.alert_window, [this](const domain::Alert& alert) {
          halt("alert escalation from " + alert.source);
        });
  }

  // ---  4) IpcServer and telemetry bridges ----------------------------------
  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);
    ipc_server_->start();
  }

  IpcServer* ipc = ipc_server_.get();
  bridge_subscription_ = bus_.subscribe([this, ipc](const Event& event) {
    notification_loop_.push(event);
    if (ipc != nullptr) {
      ipc->pushTelemetry(event);
    }
  });
  bridge_wired_ = true;

  // ---  5) Open intake, then start supervision ------------------------------
  {
    std::unique_lock state_lock(state_mutex_);
    halted_.store(false);
    running_.store(true);
  }
  monitor_->start();

  // ---  6) MarketDataThread LAST (ticks begin flowing) ----------------------
  if (!config_.market_data_endpoint.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        [this](const MarketDataEvent& event) { pushMarketData(event); },
        config_.market_data_endpoint);
    if (!market_data_thread_->start()) {
      std::cerr << "[TradingEngine] market data disabled: cannot subscribe to "
                << config_.market_data_endpoint << "\n";
      market_data_thread_.reset();
    }
  }

  std::cout << "[TradingEngine] started. Threads: notification, "
               "risk_monitor"
            << (ipc_server_ ? ", ipc" : "")
            << (market_data_thread_ ? ", market_data" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  std::lock_guard lifecycle_lock(lifecycle_mutex_);

  std::unique_ptr<OrderLifecycleEngine> lifecycle;
  std::unique_ptr<ExecutionScheduler> scheduler;
  std::unique_ptr<RiskMonitor> monitor;
  {
    std::unique_lock state_lock(state_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
    lifecycle = std::move(lifecycle_);
    scheduler = std::move(scheduler_);
    monitor = std::move(monitor_);
  }

  // ---  1) Stop market data inflow FIRST ------------------------------------
  market_data_thread_.reset();

  // ---  2) Stop command handling. The server object stays alive: the
  //         bridge may still push telemetry until the producers below are
  //         gone.
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // ---  3) Stop supervision (no more escalations) ---------------------------
  monitor->stop();

  // ---  4) Abort parents, then tear down execution --------------------------
  lifecycle->shutdown();
  scheduler->shutdown();
  scheduler.reset();
  lifecycle.reset();
  monitor.reset();

  // ---  5) Nothing publishes any more: unhook bridges, stop the loop -------
  if (bridge_wired_) {
    bus_.unsubscribe(bridge_subscription_);
    bridge_wired_ = false;
  }
  ipc_server_.reset();
  notification_loop_.stop();

  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// submitIntent(): validation → pre-trade risk → scheduler
// -----------------------------------------------------------------------------
IntakeResult TradingEngine::submitIntent(const domain::OrderIntent& intent) {
  domain::OrderId id = 0;
  domain::ProposedDelta delta;
  domain::RiskDecision decision;
  {
    // Held through the launch so stop() cannot free the components in use.
    std::shared_lock state_lock(state_mutex_);
    if (!running_.load()) {
      return refuse(domain::ErrorCode::NotRunning, "engine is not running");
    }
    if (halted_.load()) {
      return refuse(domain::ErrorCode::EngineHalted, "engine is halted");
    }
    if (intent.quantity <= 0) {
      return refuse(domain::ErrorCode::InvalidQuantity,
                    "quantity must be > 0, got " +
                        std::to_string(intent.quantity));
    }
    if (!config_.instruments.empty() &&
        std::find(config_.instruments.begin(), config_.instruments.end(),
                  intent.instrument) == config_.instruments.end()) {
      return refuse(domain::ErrorCode::UnknownInstrument,
                    "unknown instrument '" + intent.instrument + "'");
    }
    if (auto problem = SliceSequence::validate(intent.pacing)) {
      return refuse(domain::ErrorCode::InvalidPacing, *problem);
    }

    id = order_ids_.next_id();
    delta.instrument = intent.instrument;
    delta.signed_quantity =
        domain::signedQuantity(intent.side, intent.quantity) +
        lifecycle_->outstandingQuantity(intent.instrument);

    auto limits = config_store_.current();
    decision = rules_.evaluate(delta, ledger_.snapshot(), *limits);

    if (decision.accepted() && !scheduler_->launch(id, intent)) {
      return refuse(domain::ErrorCode::EngineHalted,
                    "engine halted before order_id=" + std::to_string(id) +
                        " could start");
    }
  }

  if (!decision.accepted()) {
    RiskRejectEvent reject;
    reject.order_id = id;
    reject.instrument = intent.instrument;
    reject.proposed_quantity = delta.signed_quantity;
    reject.at_intake = true;
    reject.violations = decision.violations;
    reject.timestamp = clock_.now();
    bus_.publish(reject);

    std::cerr << "[TradingEngine] order_id=" << id << " " << intent.instrument
              << " rejected at intake: "
              << decision.violations.front().message
              << (decision.violations.size() > 1 ? " (+more)" : "") << "\n";

    IntakeResult result;
    result.outcome = IntakeResult::Outcome::RiskRejected;
    result.order_id = id;
    result.error = domain::ErrorCode::RiskRejected;
    result.violations = std::move(decision.violations);
    result.message = "rejected by pre-trade risk check";
    return result;
  }

  std::cout << "[TradingEngine] order_id=" << id << " accepted: "
            << domain::toString(intent.side) << " " << intent.quantity << " "
            << intent.instrument << " via "
            << domain::pacingName(intent.pacing) << "\n";

  IntakeResult result;
  result.outcome = IntakeResult::Outcome::Accepted;
  result.order_id = id;
  return result;
}

IntakeResult TradingEngine::refuse(domain::ErrorCode code,
                                   std::string message) const {
  std::cerr << "[TradingEngine] intake refused (" << domain::toString(code)
            << "): " << message << "\n";
  IntakeResult result;
  result.outcome = IntakeResult::Outcome::ValidationError;
  result.error = code;
  result.message = std::move(message);
  return result;
}

// -----------------------------------------------------------------------------
// Order queries
// -----------------------------------------------------------------------------
bool TradingEngine::cancel(domain::OrderId id) {
  std::shared_lock state_lock(state_mutex_);
  if (!running_.load() || !scheduler_) {
    return false;
  }
  return scheduler_->cancel(id);
}

std::optional<domain::ParentOrderReport> TradingEngine::orderStatus(
    domain::OrderId id) const {
  std::shared_lock state_lock(state_mutex_);
  if (!scheduler_) {
    return std::nullopt;
  }
  return scheduler_->report(id);
}

std::vector<domain::ParentOrderReport> TradingEngine::orderReports() const {
  std::shared_lock state_lock(state_mutex_);
  if (!scheduler_) {
    return {};
  }
  return scheduler_->reports();
}

// Polls so that stop() is never held off by a waiter.
std::optional<domain::ParentOrderReport> TradingEngine::awaitOrder(
    domain::OrderId id, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto current = orderStatus(id);
    if (!current || domain::isTerminal(current->status) ||
        std::chrono::steady_clock::now() >= deadline) {
      return current;
    }
    std::this_thread::sleep_for(kAwaitPollStep);
  }
}

std::optional<domain::Position> TradingEngine::position(
    const std::string& instrument) const {
  return ledger_.position(instrument);
}

// -----------------------------------------------------------------------------
// Risk status and configuration
// -----------------------------------------------------------------------------
domain::RiskSnapshot TradingEngine::riskStatus() const {
  domain::RiskSnapshot snap;
  std::shared_lock state_lock(state_mutex_);
  if (monitor_ && monitor_->tickCount() > 0) {
    snap = monitor_->latest();
  } else {
    snap = RiskMonitor::compute(ledger_.snapshot(), *config_store_.current());
    snap.timestamp = clock_.now();
  }
  snap.alerts_in_window = alerts_.countInWindow(config_.alert_window);
  return snap;
}

void TradingEngine::reconfigure(const domain::RiskLimitConfig& limits) {
  config_store_.replace(limits);
  std::cout << "[TradingEngine] risk limits reconfigured (version "
            << config_store_.version() << ").\n";
}

std::shared_ptr<const domain::RiskLimitConfig> TradingEngine::riskLimits()
    const {
  return config_store_.current();
}

// -----------------------------------------------------------------------------
// halt / resume / resetSession
// -----------------------------------------------------------------------------
void TradingEngine::halt(const std::string& reason) {
  {
    std::lock_guard halt_lock(halt_mutex_);
    if (halted_.exchange(true)) {
      return;
    }
    std::shared_lock state_lock(state_mutex_);
    if (scheduler_) {
      scheduler_->halt();
    }
  }

  std::cerr << "[TradingEngine] HALT: " << reason << "\n";
  alerts_.raise(domain::AlertSeverity::Critical, "engine_halted", reason);
}

void TradingEngine::resume() {
  std::lock_guard halt_lock(halt_mutex_);
  if (!halted_.exchange(false)) {
    return;
  }
  {
    std::shared_lock state_lock(state_mutex_);
    if (scheduler_) {
      scheduler_->resume();
    }
  }
  std::cout << "[TradingEngine] intake resumed.\n";
}

void TradingEngine::resetSession() {
  ledger_.resetSession();
  {
    std::shared_lock state_lock(state_mutex_);
    if (monitor_) {
      monitor_->resetDetectors();
    }
  }
  std::cout << "[TradingEngine] new risk session started.\n";
}

// -----------------------------------------------------------------------------
// pushMarketData(): cache + mark-to-market
// -----------------------------------------------------------------------------
void TradingEngine::pushMarketData(const MarketDataEvent& event) {
  market_cache_.update(event);

  double mark = event.last;
  if (mark <= 0.0 && event.bid > 0.0 && event.ask > 0.0) {
    mark = (event.bid + event.ask) / 2.0;
  }
  if (mark > 0.0) {
    ledger_.updateMark(event.instrument, mark);
  }

  if (running_.load()) {
    notification_loop_.push(event);
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  const auto [verb, arg] = splitCommand(cmd);
  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    const domain::LedgerSnapshot snapshot = ledger_.snapshot();

    response["status"] = "ok";
    response["running"] = running_.load();
    response["halted"] = halted_.load();

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& pos : snapshot.positions) {
      positions_json.push_back(toJson(pos));
    }
    response["positions"] = std::move(positions_json);
    response["aggregate"] = toJson(snapshot.aggregate);

    nlohmann::json orders_json = nlohmann::json::array();
    for (const auto& report : orderReports()) {
      orders_json.push_back(toJson(report));
    }
    response["orders"] = std::move(orders_json);
  } else if (verb == "RISK") {
    response["status"] = "ok";
    response["risk"] = toJson(riskStatus());
    response["limits"] = toJson(*config_store_.current());
    nlohmann::json critical = nlohmann::json::array();
    for (const auto& alert : criticalAlerts()) {
      critical.push_back(toJson(alert));
    }
    response["critical_alerts"] = std::move(critical);
  } else if (verb == "SUBMIT") {
    domain::OrderIntent intent;
    try {
      intent = intentFromJson(nlohmann::json::parse(arg));
    } catch (const nlohmann::json::exception& e) {
      return errorResponse(std::string("Malformed intent: ") + e.what())
          .dump();
    } catch (const std::invalid_argument& e) {
      return errorResponse(std::string("Malformed intent: ") + e.what())
          .dump();
    }

    IntakeResult result = submitIntent(intent);
    if (result.accepted()) {
      response["status"] = "ok";
      response["order_id"] = result.order_id;
    } else {
      response["status"] = "error";
      response["error"] = domain::toString(result.error);
      response["response"] = result.message;
      if (result.order_id != 0) {
        response["order_id"] = result.order_id;
      }
      nlohmann::json violations = nlohmann::json::array();
      for (const auto& v : result.violations) {
        violations.push_back(toJson(v));
      }
      response["violations"] = std::move(violations);
    }
  } else if (verb == "CANCEL") {
    domain::OrderId id = 0;
    try {
      id = std::stoull(arg);
    } catch (const std::invalid_argument&) {
      return errorResponse("Invalid order id: " + arg).dump();
    } catch (const std::out_of_range&) {
      return errorResponse("Invalid order id: " + arg).dump();
    }

    if (cancel(id)) {
      response["status"] = "ok";
      response["response"] = "Cancel requested";
      response["order_id"] = id;
    } else {
      response = errorResponse("No working order " + std::to_string(id));
    }
  } else if (verb == "RECONFIGURE") {
    try {
      reconfigure(
          parseRiskLimits(nlohmann::json::parse(arg), *riskLimits()));
    } catch (const nlohmann::json::exception& e) {
      return errorResponse(std::string("Malformed limits: ") + e.what())
          .dump();
    } catch (const domain::ConfigError& e) {
      return errorResponse(std::string("Invalid limits: ") + e.what())
          .dump();
    }
    response["status"] = "ok";
    response["limits"] = toJson(*riskLimits());
  } else if (verb == "HALT") {
    halt("operator command");
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (verb == "RESUME") {
    resume();
    response["status"] = "ok";
    response["response"] = "Trading resumed";
  } else if (verb == "RESET_SESSION") {
    resetSession();
    response["status"] = "ok";
    response["response"] = "Session reset";
  } else {
    response = errorResponse("Unknown command: " + cmd);
  }

  return response.dump();
}

}  // namespace tradeguard
