// Repository: Stagegate
// Component: Pending Queue
// Copyright (c) 2026 Stagegate

#include "stagegate/staging/PendingQueue.hpp"

#include <algorithm>

namespace stagegate::staging {

bool PendingQueue::Add(StagedRequest request) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& r : items_) {
    if (r.id == request.id) return false;
  }
  items_.push_back(std::move(request));
  return true;
}

bool PendingQueue::Contains(const std::string& request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(items_.begin(), items_.end(),
                     [&](const StagedRequest& r) { return r.id == request_id; });
}

std::optional<StagedRequest> PendingQueue::Find(const std::string& request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& r : items_) {
    if (r.id == request_id) return r;
  }
  return std::nullopt;
}

std::optional<StagedRequest> PendingQueue::Take(const std::string& request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(items_.begin(), items_.end(),
                         [&](const StagedRequest& r) { return r.id == request_id; });
  if (it == items_.end()) return std::nullopt;
  StagedRequest taken = std::move(*it);
  items_.erase(it);
  if (loading_) removed_during_load_.insert(request_id);
  return taken;
}

std::vector<StagedRequest> PendingQueue::TakeIf(
    const std::function<bool(const StagedRequest&)>& pred) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StagedRequest> taken;
  std::vector<StagedRequest> kept;
  kept.reserve(items_.size());
  for (auto& r : items_) {
    if (pred(r)) {
      if (loading_) removed_during_load_.insert(r.id);
      taken.push_back(std::move(r));
    } else {
      kept.push_back(std::move(r));
    }
  }
  items_.swap(kept);
  return taken;
}

std::vector<StagedRequest> PendingQueue::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_;
}

void PendingQueue::BeginLoad() {
  std::lock_guard<std::mutex> lock(mutex_);
  loading_ = true;
  removed_during_load_.clear();
}

size_t PendingQueue::ReplaceWithLoaded(std::vector<StagedRequest> loaded) {
  std::lock_guard<std::mutex> lock(mutex_);
  loaded.erase(std::remove_if(loaded.begin(), loaded.end(),
                              [this](const StagedRequest& r) {
                                return removed_during_load_.count(r.id) > 0;
                              }),
               loaded.end());
  loading_ = false;
  removed_during_load_.clear();

  std::set<std::string> loaded_ids;
  for (const auto& r : loaded) loaded_ids.insert(r.id);

  size_t carried = 0;
  for (auto& r : items_) {
    if (loaded_ids.count(r.id) == 0) {
      loaded.push_back(std::move(r));
      ++carried;
    }
  }
  items_.swap(loaded);
  return carried;
}

size_t PendingQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

}  // namespace stagegate::staging
