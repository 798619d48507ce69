#pragma once

#include "tradeguard/concurrent/thread_safe_queue.hpp"
#include "tradeguard/eventbus/event_bus.hpp"
#include "tradeguard/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace tradeguard {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: One worker thread that drains a ThreadSafeQueue<Event> and
// publishes each event on its own EventBus. Anything subscribed to that bus
// runs serialized on the worker.
//
// TradingEngine uses one instance as the notification loop: slice, parent,
// position, alert and risk-reject events raised on arbitrary threads are
// pushed here so external subscribers and IPC telemetry receive them in one
// order on one thread.
//
// Thread model: start(), stop() and push() may be called from any thread.
// start() and stop() are idempotent. Events still queued when stop() is
// called are dropped.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Joins the worker if still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace tradeguard
