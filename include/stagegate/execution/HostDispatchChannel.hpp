// Repository: Stagegate
// Component: Host Dispatch Channel
// Purpose: ICommandDispatcher for the daemon. The host reports principal
//          presence and drains dispatched commands from subscriber queues.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_EXECUTION_HOST_DISPATCH_CHANNEL_HPP_
#define STAGEGATE_EXECUTION_HOST_DISPATCH_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "stagegate/execution/ICommandDispatcher.hpp"

namespace stagegate::execution {

struct DispatchRecord {
  uint64_t sequence = 0;
  staging::Principal actor;
  std::string command_text;
};

// One host connection's view of the dispatch stream.
class DispatchSubscription {
 public:
  // Blocks up to timeout for the next record. nullopt on timeout or Close().
  std::optional<DispatchRecord> WaitNext(std::chrono::milliseconds timeout);
  void Close();
  bool IsClosed() const;
  size_t Backlog() const;

 private:
  friend class HostDispatchChannel;
  void Push(DispatchRecord record);
  // Closes and returns whatever the host never took.
  std::deque<DispatchRecord> CloseAndTakeBacklog();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<DispatchRecord> queue_;
  bool closed_ = false;
};

// The console principal is always active. Any other principal is active while
// the host has marked it present.
//
// Records dispatched with no subscriber attached are held (up to
// kMaxUndelivered, oldest dropped with a warning) and handed to the next
// subscriber. When the last subscriber goes away, its unread backlog and the
// record it failed to write return to that buffer in sequence order.
// Subscribers receive records in sequence order.
class HostDispatchChannel : public ICommandDispatcher {
 public:
  static constexpr size_t kMaxUndelivered = 1024;

  HostDispatchChannel() = default;

  HostDispatchChannel(const HostDispatchChannel&) = delete;
  HostDispatchChannel& operator=(const HostDispatchChannel&) = delete;

  void SetPresence(const std::string& principal_id, bool active);

  bool IsActive(const staging::Principal& principal) const override;
  void Dispatch(const staging::Principal& acting_principal,
                const std::string& command_text) override;

  std::shared_ptr<DispatchSubscription> Subscribe();
  // unwritten is a record the subscriber took but could not hand to the host.
  void Unsubscribe(const std::shared_ptr<DispatchSubscription>& subscription,
                   std::optional<DispatchRecord> unwritten = std::nullopt);

  size_t SubscriberCount() const;
  uint64_t DispatchedTotal() const;

 private:
  void PruneClosedLocked();
  void RequeueLocked(std::deque<DispatchRecord> records);
  void BufferLocked(DispatchRecord record);

  mutable std::mutex mutex_;
  std::set<std::string> present_;
  std::vector<std::shared_ptr<DispatchSubscription>> subscribers_;
  std::deque<DispatchRecord> undelivered_;
  uint64_t next_sequence_ = 1;
};

}  // namespace stagegate::execution

#endif  // STAGEGATE_EXECUTION_HOST_DISPATCH_CHANNEL_HPP_
