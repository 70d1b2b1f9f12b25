// Repository: Stagegate
// Component: JSONL History Store
// Purpose: Flat-file history backend, <data_dir>/command_history.jsonl.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_JSONL_HISTORY_STORE_HPP_
#define STAGEGATE_STORE_JSONL_HISTORY_STORE_HPP_

#include <mutex>
#include <string>

#include "stagegate/store/IHistoryStore.hpp"

namespace stagegate::store {

// One terminal request per line; the requester id inside the record is the
// grouping key. Same mirror-and-rewrite scheme as JsonlStagedRequestStore.
class JsonlHistoryStore : public IHistoryStore {
 public:
  static constexpr const char* kFileName = "command_history.jsonl";

  explicit JsonlHistoryStore(const std::string& data_dir);

  JsonlHistoryStore(const JsonlHistoryStore&) = delete;
  JsonlHistoryStore& operator=(const JsonlHistoryStore&) = delete;

  void Save(const std::string& requester_id,
            const std::vector<staging::StagedRequest>& history) override;
  std::vector<staging::StagedRequest> Load(const std::string& requester_id) override;
  HistoryMap LoadAll() override;
  void Delete(const std::string& requester_id) override;

  const std::string& FilePath() const { return path_; }

 private:
  void FlushLocked();

  std::string path_;
  std::mutex mutex_;
  HistoryMap cache_;
};

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_JSONL_HISTORY_STORE_HPP_
