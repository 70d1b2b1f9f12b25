// Repository: Stagegate
// Component: History Recorder
// Purpose: Capped, per-requester log of terminal decisions, persisted on the
//          storage executor independently of the pending queue.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STAGING_HISTORY_RECORDER_HPP_
#define STAGEGATE_STAGING_HISTORY_RECORDER_HPP_

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "stagegate/runtime/StorageExecutor.hpp"
#include "stagegate/staging/StagedRequest.hpp"
#include "stagegate/store/IHistoryStore.hpp"

namespace stagegate::staging {

class HistoryRecorder {
 public:
  static constexpr size_t kDefaultMaxPerRequester = 50;

  HistoryRecorder(std::shared_ptr<store::IHistoryStore> store,
                  std::shared_ptr<runtime::StorageExecutor> executor,
                  size_t max_per_requester = kDefaultMaxPerRequester);

  HistoryRecorder(const HistoryRecorder&) = delete;
  HistoryRecorder& operator=(const HistoryRecorder&) = delete;

  // Appends a snapshot of a decided request under its requester. Past the cap
  // the entry with the lowest timestamp is evicted. The requester's full list
  // is then saved asynchronously.
  void Record(const StagedRequest& terminal);

  // Newest first.
  std::vector<StagedRequest> HistoryFor(const std::string& requester_id) const;
  std::vector<StagedRequest> RecentHistoryFor(const std::string& requester_id,
                                              size_t limit) const;

  // Asynchronously loads persisted history and merges it with anything
  // recorded in the meantime (deduplicated by id, then capped).
  void LoadAsync();

  size_t RequesterCount() const;
  size_t MaxPerRequester() const { return max_per_requester_; }

 private:
  struct Book {
    mutable std::mutex mutex;
    std::map<std::string, std::vector<StagedRequest>> by_requester;
  };

  static void EvictOverflow(std::vector<StagedRequest>& entries, size_t cap);

  std::shared_ptr<store::IHistoryStore> store_;
  std::shared_ptr<runtime::StorageExecutor> executor_;
  const size_t max_per_requester_;
  std::shared_ptr<Book> book_;
};

}  // namespace stagegate::staging

#endif  // STAGEGATE_STAGING_HISTORY_RECORDER_HPP_
