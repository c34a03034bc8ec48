#include "tradeledger/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace tradeledger {

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(update)
// -----------------------------------------------------------------------------
void EventBus::publish(const LedgerUpdate& update) {
  std::vector<SubscriberEntry> copy;
  {
    // Callbacks must not run under the lock: the IPC feed and tests
    // re-enter the bus from inside their handlers.
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  // A throwing subscriber is logged and skipped; the update is already
  // committed and the remaining subscribers still receive it.
  for (const auto& [id, callback] : copy) {
    try {
      callback(update);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] subscriber " << id << " threw: " << e.what()
                << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// subscriberCount()
// -----------------------------------------------------------------------------
std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace tradeledger
