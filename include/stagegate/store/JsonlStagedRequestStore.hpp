// Repository: Stagegate
// Component: JSONL Staged Request Store
// Purpose: Flat-file backend. One StagedRequest per line in
//          <data_dir>/staged_requests.jsonl, rewritten atomically per mutation.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_JSONL_STAGED_REQUEST_STORE_HPP_
#define STAGEGATE_STORE_JSONL_STAGED_REQUEST_STORE_HPP_

#include <mutex>
#include <string>
#include <vector>

#include "stagegate/store/IStagedRequestStore.hpp"

namespace stagegate::store {

// Keeps an in-memory mirror of the file. The mirror is read once at
// construction; corrupt lines are skipped with a warning. Every mutation
// updates the mirror then rewrites the whole file; a failed rewrite throws
// StorageError and the next successful rewrite carries the change.
class JsonlStagedRequestStore : public IStagedRequestStore {
 public:
  static constexpr const char* kFileName = "staged_requests.jsonl";

  // Throws StorageError if data_dir cannot be created or the file is unreadable.
  explicit JsonlStagedRequestStore(const std::string& data_dir);

  JsonlStagedRequestStore(const JsonlStagedRequestStore&) = delete;
  JsonlStagedRequestStore& operator=(const JsonlStagedRequestStore&) = delete;

  void Save(const staging::StagedRequest& request) override;
  void Delete(const std::string& request_id) override;
  std::vector<staging::StagedRequest> LoadAll() override;
  void SaveAll(const std::vector<staging::StagedRequest>& requests) override;
  void DeleteAll(const std::vector<std::string>& request_ids) override;

  const std::string& FilePath() const { return path_; }

 private:
  void UpsertLocked(const staging::StagedRequest& request);
  void EraseLocked(const std::string& request_id);
  void FlushLocked();

  std::string path_;
  std::mutex mutex_;
  std::vector<staging::StagedRequest> cache_;
};

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_JSONL_STAGED_REQUEST_STORE_HPP_
