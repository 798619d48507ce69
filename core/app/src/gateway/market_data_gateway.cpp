#include "tradeguard/gateway/market_data_gateway.hpp"
#include "tradeguard/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe to everything, bounded recv
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(TickSink sink,
                                     const std::string& endpoint)
    : sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint);
}

MarketDataEvent MarketDataGateway::parseTick(const std::string& payload) {
  auto json = nlohmann::json::parse(payload);

  MarketDataEvent md;
  md.timestamp = ms_to_timestamp(json.at("timestamp_ms").get<std::int64_t>());
  md.instrument = json.at("symbol").get<std::string>();
  md.last = json.at("price").get<double>();
  md.bid = json.value("bid", 0.0);
  md.ask = json.value("ask", 0.0);
  md.volume = json.value("volume", 0.0);
  return md;
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop, call from a dedicated thread
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);

    if (!result.has_value()) {
      // Receive timeout: re-check the stop flag.
      continue;
    }

    std::string payload = msg.to_string();

    try {
      MarketDataEvent md = parseTick(payload);
      md.sequence_id = ++sequence_;
      sink_(md);
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
                << " payload: " << payload << "\n";
    }
  }
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace tradeguard
