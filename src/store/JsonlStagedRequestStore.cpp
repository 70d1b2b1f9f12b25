// Repository: Stagegate
// Component: JSONL Staged Request Store
// Copyright (c) 2026 Stagegate

#include "stagegate/store/JsonlStagedRequestStore.hpp"

#include <algorithm>
#include <sstream>

#include "stagegate/store/JsonlFile.hpp"
#include "stagegate/util/Logger.hpp"

namespace stagegate::store {

using staging::StagedRequest;

JsonlStagedRequestStore::JsonlStagedRequestStore(const std::string& data_dir)
    : path_(data_dir + "/" + kFileName) {
  EnsureDirectory(data_dir);

  size_t line_no = 0;
  for (const auto& line : ReadLines(path_)) {
    ++line_no;
    StagedRequest r;
    if (!StagedRequest::FromJsonLine(line, r)) {
      std::ostringstream oss;
      oss << "[JsonlStagedRequestStore] SKIP_CORRUPT_LINE path=" << path_
          << " line=" << line_no;
      util::Logger::Warn(oss.str());
      continue;
    }
    UpsertLocked(r);
  }
}

void JsonlStagedRequestStore::UpsertLocked(const StagedRequest& request) {
  EraseLocked(request.id);
  cache_.push_back(request);
}

void JsonlStagedRequestStore::EraseLocked(const std::string& request_id) {
  cache_.erase(std::remove_if(cache_.begin(), cache_.end(),
                              [&](const StagedRequest& r) { return r.id == request_id; }),
               cache_.end());
}

void JsonlStagedRequestStore::FlushLocked() {
  std::vector<std::string> lines;
  lines.reserve(cache_.size());
  for (const auto& r : cache_) lines.push_back(r.ToJsonLine());
  WriteLinesAtomically(path_, lines);
}

void JsonlStagedRequestStore::Save(const StagedRequest& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  UpsertLocked(request);
  FlushLocked();
}

void JsonlStagedRequestStore::Delete(const std::string& request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  EraseLocked(request_id);
  FlushLocked();
}

std::vector<StagedRequest> JsonlStagedRequestStore::LoadAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_;
}

void JsonlStagedRequestStore::SaveAll(const std::vector<StagedRequest>& requests) {
  if (requests.empty()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& r : requests) UpsertLocked(r);
  FlushLocked();
}

void JsonlStagedRequestStore::DeleteAll(const std::vector<std::string>& request_ids) {
  if (request_ids.empty()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& id : request_ids) EraseLocked(id);
  FlushLocked();
}

}  // namespace stagegate::store
