// Repository: Stagegate
// Component: History Recorder
// Copyright (c) 2026 Stagegate

#include "stagegate/staging/HistoryRecorder.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "stagegate/util/Logger.hpp"

namespace stagegate::staging {

HistoryRecorder::HistoryRecorder(std::shared_ptr<store::IHistoryStore> store,
                                 std::shared_ptr<runtime::StorageExecutor> executor,
                                 size_t max_per_requester)
    : store_(std::move(store)),
      executor_(std::move(executor)),
      max_per_requester_(max_per_requester == 0 ? 1 : max_per_requester),
      book_(std::make_shared<Book>()) {}

void HistoryRecorder::EvictOverflow(std::vector<StagedRequest>& entries, size_t cap) {
  while (entries.size() > cap) {
    auto oldest = std::min_element(entries.begin(), entries.end(),
                                   [](const StagedRequest& a, const StagedRequest& b) {
                                     return a.timestamp_ms < b.timestamp_ms;
                                   });
    entries.erase(oldest);
  }
}

void HistoryRecorder::Record(const StagedRequest& terminal) {
  const std::string requester_id = terminal.requester.id;
  std::vector<StagedRequest> copy;
  {
    std::lock_guard<std::mutex> lock(book_->mutex);
    auto& entries = book_->by_requester[requester_id];
    entries.push_back(terminal);
    EvictOverflow(entries, max_per_requester_);
    copy = entries;
  }

  auto store = store_;
  // Snapshots for one requester must land in order.
  executor_->SubmitOrdered("history.save", {"history:" + requester_id},
                           [store, requester_id, copy]() { store->Save(requester_id, copy); });
}

std::vector<StagedRequest> HistoryRecorder::HistoryFor(const std::string& requester_id) const {
  std::vector<StagedRequest> out;
  {
    std::lock_guard<std::mutex> lock(book_->mutex);
    auto it = book_->by_requester.find(requester_id);
    if (it == book_->by_requester.end()) return out;
    out = it->second;
  }
  std::stable_sort(out.begin(), out.end(), [](const StagedRequest& a, const StagedRequest& b) {
    return a.timestamp_ms > b.timestamp_ms;
  });
  return out;
}

std::vector<StagedRequest> HistoryRecorder::RecentHistoryFor(const std::string& requester_id,
                                                             size_t limit) const {
  auto out = HistoryFor(requester_id);
  if (out.size() > limit) out.resize(limit);
  return out;
}

void HistoryRecorder::LoadAsync() {
  auto store = store_;
  auto book = book_;
  const size_t cap = max_per_requester_;
  executor_->Submit("history.load", [store, book, cap]() {
    store::HistoryMap loaded = store->LoadAll();
    size_t records = 0;
    {
      std::lock_guard<std::mutex> lock(book->mutex);
      for (auto& entry : loaded) {
        auto& entries = book->by_requester[entry.first];
        std::set<std::string> known;
        for (const auto& r : entries) known.insert(r.id);
        for (auto& r : entry.second) {
          if (known.insert(r.id).second) entries.push_back(std::move(r));
        }
        EvictOverflow(entries, cap);
        records += entries.size();
      }
    }
    std::ostringstream oss;
    oss << "[HistoryRecorder] LOADED requesters=" << loaded.size() << " records=" << records;
    util::Logger::Info(oss.str());
  });
}

size_t HistoryRecorder::RequesterCount() const {
  std::lock_guard<std::mutex> lock(book_->mutex);
  return book_->by_requester.size();
}

}  // namespace stagegate::staging
