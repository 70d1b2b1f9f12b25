// Repository: Stagegate
// Component: Event Bus
// Purpose: Synchronous, ordered fan-out of lifecycle events to listeners.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_EVENTS_EVENT_BUS_HPP_
#define STAGEGATE_EVENTS_EVENT_BUS_HPP_

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "stagegate/events/LifecycleEvent.hpp"

namespace stagegate::events {

// Each event is delivered at most once to every listener subscribed at the
// time of Publish, in subscription order. A listener that throws is logged and
// skipped; the remaining listeners still receive the event.
class EventBus {
 public:
  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  void Subscribe(std::shared_ptr<ILifecycleListener> listener);
  // Returns false if listener was not subscribed.
  bool Unsubscribe(const std::shared_ptr<ILifecycleListener>& listener);

  void Publish(const LifecycleEvent& event);

  size_t SubscriberCount() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ILifecycleListener>> listeners_;
};

}  // namespace stagegate::events

#endif  // STAGEGATE_EVENTS_EVENT_BUS_HPP_
