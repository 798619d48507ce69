// -----------------------------------------------------------------------------
// tradeguard — single executable entry point.
//
//   1) Load the engine configuration (JSON) from argv[1], or
//      config/tradeguard.json when no argument is given.
//   2) Create the TradingEngine with a live clock and the built-in
//      SimulatedVenue.
//   3) Subscribe logging callbacks on the notification bus so parent order
//      outcomes and alerts are visible on the console.
//   4) Start the engine, reconciling positions and cash from the config.
//   5) Wait on the main thread until Ctrl-C, then shut down cleanly.
//
// Thread layout: see TradingEngine. The main thread only waits.
// -----------------------------------------------------------------------------

#include "tradeguard/config/config_loader.hpp"
#include "tradeguard/domain/error_code.hpp"
#include "tradeguard/domain/to_string.hpp"
#include "tradeguard/engine/trading_engine.hpp"
#include "tradeguard/events/alert_event.hpp"
#include "tradeguard/events/parent_order_update_event.hpp"
#include "tradeguard/risk/i_reconciler.hpp"
#include "tradeguard/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for the signal handler. The only global in the program; set
// by SIGINT/SIGTERM, polled by the main thread.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void signal_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/tradeguard.json";

  // -------------------------------------------------------------------------
  // 1) Configuration. A bad file is fatal before anything starts.
  // -------------------------------------------------------------------------
  tradeguard::EngineConfig config;
  try {
    config = tradeguard::loadConfig(config_path);
  } catch (const tradeguard::domain::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Engine with the live clock.
  // -------------------------------------------------------------------------
  tradeguard::LiveTimeProvider clock;
  tradeguard::TradingEngine engine(config, clock);

  // -------------------------------------------------------------------------
  // 3) Console observers, registered BEFORE start() so nothing is missed.
  // These callbacks run on the notification loop thread.
  // -------------------------------------------------------------------------
  engine.notificationBus().subscribe<tradeguard::ParentOrderUpdateEvent>(
      [](const tradeguard::ParentOrderUpdateEvent& e) {
        std::cout << "[ParentOrder] order_id=" << e.report.order_id
                  << " status="
                  << tradeguard::domain::toString(e.report.status)
                  << " filled=" << e.report.filled_quantity << "/"
                  << e.report.target_quantity << "\n";
      });

  engine.notificationBus().subscribe<tradeguard::AlertEvent>(
      [](const tradeguard::AlertEvent& e) {
        std::cout << "[Alert] "
                  << tradeguard::domain::toString(e.alert.severity) << " "
                  << e.alert.source << ": " << e.alert.message << "\n";
      });

  // -------------------------------------------------------------------------
  // 4) Start, hydrating the ledger from the configured account state.
  // -------------------------------------------------------------------------
  tradeguard::StaticReconciler reconciler(config.initial_positions,
                                          config.initial_cash);
  engine.start(&reconciler);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  std::cout << "[main] tradeguard running. Commands on "
            << (config.command_endpoint.empty() ? "<disabled>"
                                                : config.command_endpoint)
            << ", market data from "
            << (config.market_data_endpoint.empty()
                    ? "<disabled>"
                    : config.market_data_endpoint)
            << ".\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 5) Wait for a shutdown signal, then stop the engine.
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
