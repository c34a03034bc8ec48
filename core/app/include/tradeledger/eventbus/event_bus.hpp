#pragma once

#include "tradeledger/events/ledger_update.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for committed LedgerUpdate
// values. The LifecycleEngine is the only publisher; any number of
// downstream observers (the IPC telemetry feed, logging, netting adapters)
// subscribe.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread. The engine publishes
// after releasing its ledger lock, so a callback may query the engine.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const LedgerUpdate&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback invoked for every published update.
  // @return Id to pass to unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<UpdateType>(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback invoked only when the published variant
  //         holds UpdateType (e.g. TradeStateUpdate).
  // -------------------------------------------------------------------------
  template <typename UpdateType>
  SubscriptionId subscribe(std::function<void(const UpdateType&)> callback);

  // Removes a subscription. Unknown ids are ignored. A publish() already in
  // flight may still deliver its current update to the removed callback.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(update)
  // -------------------------------------------------------------------------
  // @brief  Delivers the update to every current subscriber in subscription
  //         order.
  //
  // @details
  // The subscriber list is copied under the lock and the callbacks run
  // without it, so a callback may subscribe, unsubscribe or publish without
  // deadlocking. A std::exception thrown by a callback is logged to
  // std::cerr and does not stop delivery to the later subscribers.
  // -------------------------------------------------------------------------
  void publish(const LedgerUpdate& update);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename UpdateType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const UpdateType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](
                                const LedgerUpdate& update) {
    if (const auto* ptr = std::get_if<UpdateType>(&update)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace tradeledger
