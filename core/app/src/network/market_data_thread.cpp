#include "tradeguard/network/market_data_thread.hpp"

#include <zmq.hpp>

#include <iostream>
#include <utility>

namespace tradeguard {

MarketDataThread::MarketDataThread(MarketDataGateway::TickSink sink,
                                   std::string endpoint)
    : sink_(std::move(sink)), endpoint_(std::move(endpoint)) {}

MarketDataThread::~MarketDataThread() { stop(); }

bool MarketDataThread::start() {
  if (worker_.joinable()) {
    return true;
  }

  try {
    gateway_ = std::make_unique<MarketDataGateway>(
        [this](const MarketDataEvent& event) {
          ++ticks_;
          sink_(event);
        },
        endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[MarketDataThread] cannot connect to " << endpoint_ << ": "
              << e.what() << "\n";
    gateway_.reset();
    return false;
  }

  const std::uint64_t session = ++sessions_;
  session_live_.store(true);
  worker_ = std::thread(&MarketDataThread::runSession, this, session);
  return true;
}

void MarketDataThread::runSession(std::uint64_t session) {
  std::cout << "[MarketDataThread] session " << session << " subscribed to "
            << endpoint_ << "\n";
  try {
    gateway_->run();
  } catch (const zmq::error_t& e) {
    std::cerr << "[MarketDataThread] session " << session
              << " aborted: " << e.what() << "\n";
  }
  session_live_.store(false);
  std::cout << "[MarketDataThread] session " << session << " closed after "
            << gateway_->ticksReceived() << " ticks.\n";
}

void MarketDataThread::stop() {
  if (!gateway_) {
    return;
  }
  gateway_->stop();
  if (worker_.joinable()) {
    worker_.join();
  }
  gateway_.reset();
  session_live_.store(false);
}

bool MarketDataThread::restart() {
  stop();
  return start();
}

}  // namespace tradeguard
