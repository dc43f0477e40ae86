#pragma once

#include "hft/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace hft {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for pipeline notifications.
// Subscribers register callbacks; the pipeline publishes Event values after
// each admission, rejection, fill and breaker trip.
//
// Each Pipeline owns its own bus, so observers of one instrument never see
// another instrument's events.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe and
// publish. Callbacks run synchronously on the thread that calls publish()
// (the pipeline thread), so they must be short.
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
  // Registers a callback invoked for every published event. Returns an id
  // for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only for events holding EventType.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // If publish() is in progress on another thread, the callback may still
  // run for the current event, but not for later ones.
  void unsubscribe(SubscriptionId id);

  // Delivers the event to every subscriber before returning. The subscriber
  // list is copied under the lock and callbacks run without it, so a
  // callback may publish or unsubscribe without deadlocking.
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
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

}  // namespace hft
