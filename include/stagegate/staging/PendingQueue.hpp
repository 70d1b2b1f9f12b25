// Repository: Stagegate
// Component: Pending Queue
// Purpose: Mutex-guarded, insertion-ordered collection of PENDING requests.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STAGING_PENDING_QUEUE_HPP_
#define STAGEGATE_STAGING_PENDING_QUEUE_HPP_

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "stagegate/staging/StagedRequest.hpp"

namespace stagegate::staging {

// Take() is the single-decision guard: for a given id exactly one caller gets
// the request back, every other concurrent caller gets nullopt.
class PendingQueue {
 public:
  PendingQueue() = default;

  PendingQueue(const PendingQueue&) = delete;
  PendingQueue& operator=(const PendingQueue&) = delete;

  // Returns false if a request with the same id is already queued.
  bool Add(StagedRequest request);

  bool Contains(const std::string& request_id) const;
  std::optional<StagedRequest> Find(const std::string& request_id) const;

  // Atomically removes and returns the request.
  std::optional<StagedRequest> Take(const std::string& request_id);

  // Atomically removes and returns every request matching pred, in order.
  std::vector<StagedRequest> TakeIf(const std::function<bool(const StagedRequest&)>& pred);

  // Copy of the current contents, in insertion order.
  std::vector<StagedRequest> Snapshot() const;

  // Marks the start of a durable load. Until ReplaceWithLoaded, ids removed
  // by Take/TakeIf are remembered so a stale durable copy cannot revive them.
  void BeginLoad();

  // Load completion: contents become loaded (minus ids decided since
  // BeginLoad), followed by any request added since the load began and not
  // part of loaded. Returns the number of such carried-over requests.
  size_t ReplaceWithLoaded(std::vector<StagedRequest> loaded);

  size_t Size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<StagedRequest> items_;
  bool loading_ = false;
  std::set<std::string> removed_during_load_;
};

}  // namespace stagegate::staging

#endif  // STAGEGATE_STAGING_PENDING_QUEUE_HPP_
