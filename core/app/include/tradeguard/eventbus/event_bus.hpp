#pragma once

#include "tradeguard/events/event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tradeguard {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish-subscribe channel for Event values.
// The ledger, lifecycle engine, scheduler tasks and alert log publish on the
// engine's core bus; TradingEngine bridges selected types onto the
// notification loop, whose bus is what external subscribers see.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run on the publishing thread before publish() returns, never
// under the bus mutex, so a callback may publish or unsubscribe.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback for every event type. Returns the id to pass to
  // unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback that only fires when the published variant holds
  // EventType. Implemented as a filtering wrapper around the generic form.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // Removes the subscription. A publish() already in flight on another
  // thread may still invoke it once.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Snapshots the subscriber list under the lock, then invokes each callback
  // on the calling thread with the lock released.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace tradeguard
