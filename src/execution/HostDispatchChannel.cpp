// Repository: Stagegate
// Component: Host Dispatch Channel
// Copyright (c) 2026 Stagegate

#include "stagegate/execution/HostDispatchChannel.hpp"

#include <algorithm>
#include <sstream>

#include "stagegate/util/Logger.hpp"

namespace stagegate::execution {

// -----------------------------------------------------------------------------
// DispatchSubscription
// -----------------------------------------------------------------------------

std::optional<DispatchRecord> DispatchSubscription::WaitNext(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) return std::nullopt;
  DispatchRecord record = std::move(queue_.front());
  queue_.pop_front();
  return record;
}

void DispatchSubscription::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  cv_.notify_all();
}

bool DispatchSubscription::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t DispatchSubscription::Backlog() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::deque<DispatchRecord> DispatchSubscription::CloseAndTakeBacklog() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  std::deque<DispatchRecord> backlog;
  backlog.swap(queue_);
  cv_.notify_all();
  return backlog;
}

void DispatchSubscription::Push(DispatchRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) return;
  queue_.push_back(std::move(record));
  cv_.notify_one();
}

// -----------------------------------------------------------------------------
// HostDispatchChannel
// -----------------------------------------------------------------------------

void HostDispatchChannel::SetPresence(const std::string& principal_id, bool active) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active)
    present_.insert(principal_id);
  else
    present_.erase(principal_id);
}

bool HostDispatchChannel::IsActive(const staging::Principal& principal) const {
  if (principal.id == staging::kConsolePrincipalId) return true;
  std::lock_guard<std::mutex> lock(mutex_);
  return present_.count(principal.id) > 0;
}

void HostDispatchChannel::Dispatch(const staging::Principal& acting_principal,
                                   const std::string& command_text) {
  std::lock_guard<std::mutex> lock(mutex_);
  DispatchRecord record;
  record.sequence = next_sequence_++;
  record.actor = acting_principal;
  record.command_text = command_text;

  PruneClosedLocked();

  std::ostringstream oss;
  oss << "[HostDispatchChannel] DISPATCH sequence=" << record.sequence
      << " actor=" << acting_principal.name << " subscribers=" << subscribers_.size();
  util::Logger::Debug(oss.str());

  if (subscribers_.empty()) {
    BufferLocked(std::move(record));
    return;
  }
  // Pushed under the channel lock so every subscriber sees sequence order.
  for (const auto& s : subscribers_) s->Push(record);
}

std::shared_ptr<DispatchSubscription> HostDispatchChannel::Subscribe() {
  auto subscription = std::make_shared<DispatchSubscription>();
  std::lock_guard<std::mutex> lock(mutex_);
  PruneClosedLocked();
  while (!undelivered_.empty()) {
    subscription->Push(std::move(undelivered_.front()));
    undelivered_.pop_front();
  }
  subscribers_.push_back(subscription);
  return subscription;
}

void HostDispatchChannel::Unsubscribe(const std::shared_ptr<DispatchSubscription>& subscription,
                                      std::optional<DispatchRecord> unwritten) {
  if (!subscription) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::deque<DispatchRecord> backlog = subscription->CloseAndTakeBacklog();
  if (unwritten) backlog.push_front(std::move(*unwritten));
  subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscription),
                     subscribers_.end());
  PruneClosedLocked();
  // A remaining subscriber already holds every record this one had.
  if (subscribers_.empty()) RequeueLocked(std::move(backlog));
}

void HostDispatchChannel::PruneClosedLocked() {
  std::deque<DispatchRecord> orphaned;
  for (auto it = subscribers_.begin(); it != subscribers_.end();) {
    if ((*it)->IsClosed()) {
      for (auto& r : (*it)->CloseAndTakeBacklog()) orphaned.push_back(std::move(r));
      it = subscribers_.erase(it);
    } else {
      ++it;
    }
  }
  if (subscribers_.empty()) RequeueLocked(std::move(orphaned));
}

void HostDispatchChannel::RequeueLocked(std::deque<DispatchRecord> records) {
  if (records.empty()) return;
  {
    std::ostringstream oss;
    oss << "[HostDispatchChannel] REQUEUED records=" << records.size()
        << " first_sequence=" << records.front().sequence;
    util::Logger::Info(oss.str());
  }
  for (auto& r : undelivered_) records.push_back(std::move(r));
  std::sort(records.begin(), records.end(),
            [](const DispatchRecord& a, const DispatchRecord& b) { return a.sequence < b.sequence; });
  records.erase(std::unique(records.begin(), records.end(),
                            [](const DispatchRecord& a, const DispatchRecord& b) {
                              return a.sequence == b.sequence;
                            }),
                records.end());
  undelivered_.clear();
  for (auto& r : records) BufferLocked(std::move(r));
}

void HostDispatchChannel::BufferLocked(DispatchRecord record) {
  if (undelivered_.size() >= kMaxUndelivered) {
    std::ostringstream oss;
    oss << "[HostDispatchChannel] UNDELIVERED_DROPPED sequence=" << undelivered_.front().sequence;
    util::Logger::Warn(oss.str());
    undelivered_.pop_front();
  }
  undelivered_.push_back(std::move(record));
}

size_t HostDispatchChannel::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

uint64_t HostDispatchChannel::DispatchedTotal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_sequence_ - 1;
}

}  // namespace stagegate::execution
