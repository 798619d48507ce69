#pragma once

#include "tradeguard/concurrent/thread_safe_queue.hpp"
#include "tradeguard/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers commands on a REP socket and
//         broadcasts JSON telemetry on a PUB socket.
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (telemetry):
//      Broadcasts one JSON object per SliceUpdateEvent,
//      ParentOrderUpdateEvent, PositionUpdateEvent, AlertEvent and
//      RiskRejectEvent. Events arrive through pushTelemetry() from the
//      engine's notification loop and are buffered in a ThreadSafeQueue, so
//      serialization and socket I/O never run on an order path thread.
//
//   2. REP socket (commands):
//      Receives one command string per request, hands it to the command
//      handler (TradingEngine::executeCommand()) and sends the handler's
//      JSON reply. ZMQ_RCVTIMEO bounds each poll so the thread alternates
//      between commands and telemetry and notices stop() promptly.
//
// Every telemetry object carries a "type" field: "slice_update",
// "parent_update", "position_update", "alert" or "risk_reject".
//
// Thread model:
//   start() and stop() from the owning thread. pushTelemetry() from any
//   thread. The command handler runs on the IPC thread.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker.
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it, closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return The JSON line published for the event, or std::nullopt for
  //         event types that are not telemetry (market data).
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tradeguard
