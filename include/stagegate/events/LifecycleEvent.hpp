// Repository: Stagegate
// Component: Lifecycle Events
// Purpose: Typed notifications emitted on every request transition.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_EVENTS_LIFECYCLE_EVENT_HPP_
#define STAGEGATE_EVENTS_LIFECYCLE_EVENT_HPP_

#include <cstdint>

#include "stagegate/staging/StagedRequest.hpp"

namespace stagegate::events {

enum class LifecycleEventKind {
  kStaged,
  kApproved,
  kRejected,
};

const char* LifecycleEventKindName(LifecycleEventKind kind);

struct LifecycleEvent {
  LifecycleEventKind kind = LifecycleEventKind::kStaged;
  // Full snapshot taken at the transition.
  staging::StagedRequest request;
  // Decision time minus staging time. 0 for kStaged and auto-approvals.
  int64_t review_elapsed_ms = 0;
  // No reviewer decided: auto-approval or a decision with a null reviewer.
  bool system_actor = false;
  // Approved by the time-window rule at stage time; never entered pending.
  bool auto_approved = false;
};

// Fixed handler per kind. Handlers run synchronously on the thread that made
// the transition; keep them short and never call back into the engine.
class ILifecycleListener {
 public:
  virtual ~ILifecycleListener() = default;

  virtual void OnStaged(const LifecycleEvent& /*event*/) {}
  virtual void OnApproved(const LifecycleEvent& /*event*/) {}
  virtual void OnRejected(const LifecycleEvent& /*event*/) {}
};

}  // namespace stagegate::events

#endif  // STAGEGATE_EVENTS_LIFECYCLE_EVENT_HPP_
