#include "hft/eventbus/event_bus.hpp"

#include <algorithm>

namespace hft {

// ---- subscribe ----
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// ---- unsubscribe ----
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// ---- publish ----
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;
  {
    // Copy the list under the lock and invoke outside it, so a callback may
    // subscribe, unsubscribe or publish again without deadlocking. A
    // subscriber added during this publish() sees the next event, not this
    // one.
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  for (const auto& [id, callback] : copy) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace hft
