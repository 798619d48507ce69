#include "tradeguard/network/ipc_server.hpp"
#include "tradeguard/domain/to_string.hpp"
#include "tradeguard/network/json_codec.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace tradeguard {

namespace {

// -----------------------------------------------------------------------------
// Per-event telemetry formatters
// -----------------------------------------------------------------------------
std::string formatSliceUpdate(const SliceUpdateEvent& e) {
  nlohmann::json j = toJson(e.slice);
  j["type"] = "slice_update";
  j["previous_status"] = domain::toString(e.previous_status);
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string formatParentUpdate(const ParentOrderUpdateEvent& e) {
  nlohmann::json j = toJson(e.report);
  j["type"] = "parent_update";
  return j.dump();
}

std::string formatPositionUpdate(const PositionUpdateEvent& e) {
  nlohmann::json j = toJson(e.position);
  j["type"] = "position_update";
  j["fill_id"] = e.fill_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string formatAlert(const AlertEvent& e) {
  nlohmann::json j = toJson(e.alert);
  j["type"] = "alert";
  return j.dump();
}

std::string formatRiskReject(const RiskRejectEvent& e) {
  nlohmann::json j;
  j["type"] = "risk_reject";
  j["order_id"] = e.order_id;
  j["instrument"] = e.instrument;
  j["proposed_quantity"] = e.proposed_quantity;
  j["at_intake"] = e.at_intake;
  j["slice_index"] = e.slice_index;
  nlohmann::json violations = nlohmann::json::array();
  for (const auto& v : e.violations) {
    violations.push_back(toJson(v));
  }
  j["violations"] = std::move(violations);
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Publish whatever is still queued before the sockets close.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      auto sent = pub_socket_->send(msg, zmq::send_flags::dontwait);
      if (!sent.has_value()) {
        std::cerr << "[IpcServer] telemetry dropped (PUB would block)\n";
      }
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<SliceUpdateEvent>(&event)) {
    return formatSliceUpdate(*e);
  }
  if (auto* e = std::get_if<ParentOrderUpdateEvent>(&event)) {
    return formatParentUpdate(*e);
  }
  if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    return formatPositionUpdate(*e);
  }
  if (auto* e = std::get_if<AlertEvent>(&event)) {
    return formatAlert(*e);
  }
  if (auto* e = std::get_if<RiskRejectEvent>(&event)) {
    return formatRiskReject(*e);
  }
  return std::nullopt;
}

}  // namespace tradeguard
