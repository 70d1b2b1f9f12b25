// Repository: Stagegate
// Component: JSONL History Store
// Copyright (c) 2026 Stagegate

#include "stagegate/store/JsonlHistoryStore.hpp"

#include <sstream>

#include "stagegate/store/JsonlFile.hpp"
#include "stagegate/util/Logger.hpp"

namespace stagegate::store {

using staging::StagedRequest;

JsonlHistoryStore::JsonlHistoryStore(const std::string& data_dir)
    : path_(data_dir + "/" + kFileName) {
  EnsureDirectory(data_dir);

  size_t line_no = 0;
  size_t skipped = 0;
  for (const auto& line : ReadLines(path_)) {
    ++line_no;
    StagedRequest r;
    if (!StagedRequest::FromJsonLine(line, r)) {
      ++skipped;
      std::ostringstream oss;
      oss << "[JsonlHistoryStore] SKIP_CORRUPT_LINE path=" << path_ << " line=" << line_no;
      util::Logger::Warn(oss.str());
      continue;
    }
    cache_[r.requester.id].push_back(std::move(r));
  }
  if (line_no > 0) {
    std::ostringstream oss;
    oss << "[JsonlHistoryStore] LOADED requesters=" << cache_.size()
        << " records=" << (line_no - skipped);
    util::Logger::Debug(oss.str());
  }
}

void JsonlHistoryStore::FlushLocked() {
  std::vector<std::string> lines;
  for (const auto& entry : cache_) {
    for (const auto& r : entry.second) lines.push_back(r.ToJsonLine());
  }
  WriteLinesAtomically(path_, lines);
}

void JsonlHistoryStore::Save(const std::string& requester_id,
                             const std::vector<StagedRequest>& history) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (history.empty())
    cache_.erase(requester_id);
  else
    cache_[requester_id] = history;
  FlushLocked();
}

std::vector<StagedRequest> JsonlHistoryStore::Load(const std::string& requester_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find(requester_id);
  if (it == cache_.end()) return {};
  return it->second;
}

HistoryMap JsonlHistoryStore::LoadAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_;
}

void JsonlHistoryStore::Delete(const std::string& requester_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.erase(requester_id);
  FlushLocked();
}

}  // namespace stagegate::store
