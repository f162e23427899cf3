#pragma once

#include "sentinel/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace sentinel {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish-subscribe fan-out for lifecycle events.
//
// @details
// Owned by the AsyncNotifier and driven from its worker thread: the notifier
// pops an Event off its queue and publishes it here, and every subscriber
// (console alert log, IPC telemetry, strategy stats, tests) runs on that
// worker. Nothing on the monitoring path calls publish() directly.
//
// A subscriber that throws is logged and skipped; the remaining subscribers
// still receive the event.
//
// Thread model:
//   subscribe / unsubscribe / publish are safe from any thread. Callbacks run
//   on the publishing thread without the internal lock held, so a callback
//   may itself subscribe, unsubscribe or publish.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  // Invoked only when the published Event holds an EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriber_count() const;

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

}  // namespace sentinel
