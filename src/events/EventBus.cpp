// Repository: Stagegate
// Component: Event Bus
// Copyright (c) 2026 Stagegate

#include "stagegate/events/EventBus.hpp"

#include <algorithm>
#include <sstream>

#include "stagegate/util/Logger.hpp"

namespace stagegate::events {

const char* LifecycleEventKindName(LifecycleEventKind kind) {
  switch (kind) {
    case LifecycleEventKind::kStaged:   return "STAGED";
    case LifecycleEventKind::kApproved: return "APPROVED";
    case LifecycleEventKind::kRejected: return "REJECTED";
  }
  return "UNKNOWN";
}

void EventBus::Subscribe(std::shared_ptr<ILifecycleListener> listener) {
  if (!listener) return;
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(std::move(listener));
}

bool EventBus::Unsubscribe(const std::shared_ptr<ILifecycleListener>& listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find(listeners_.begin(), listeners_.end(), listener);
  if (it == listeners_.end()) return false;
  listeners_.erase(it);
  return true;
}

size_t EventBus::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

void EventBus::Publish(const LifecycleEvent& event) {
  // Snapshot so listeners may (un)subscribe without deadlocking.
  std::vector<std::shared_ptr<ILifecycleListener>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = listeners_;
  }

  for (const auto& listener : snapshot) {
    try {
      switch (event.kind) {
        case LifecycleEventKind::kStaged:   listener->OnStaged(event); break;
        case LifecycleEventKind::kApproved: listener->OnApproved(event); break;
        case LifecycleEventKind::kRejected: listener->OnRejected(event); break;
      }
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[EventBus] LISTENER_FAILED event=" << LifecycleEventKindName(event.kind)
          << " request_id=" << event.request.id << " error=" << e.what();
      util::Logger::Error(oss.str());
    }
  }
}

}  // namespace stagegate::events
