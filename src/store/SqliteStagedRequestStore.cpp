// Repository: Stagegate
// Component: SQLite Staged Request Store
// Copyright (c) 2026 Stagegate

#include "stagegate/store/SqliteStagedRequestStore.hpp"

#include <sstream>

#include "stagegate/store/SqliteRow.hpp"
#include "stagegate/util/Logger.hpp"

namespace stagegate::store {

using staging::StagedRequest;

SqliteStagedRequestStore::SqliteStagedRequestStore(const std::string& db_path,
                                                   const std::string& table_prefix)
    : db_(db_path), table_(CheckedTablePrefix(table_prefix) + "staged_requests") {
  db_.Exec("CREATE TABLE IF NOT EXISTS " + table_ + " ("
           "id TEXT PRIMARY KEY, "
           "requester_id TEXT NOT NULL, "
           "requester_name TEXT NOT NULL, "
           "command_text TEXT NOT NULL, "
           "timestamp_ms INTEGER NOT NULL, "
           "justification TEXT, "
           "reviewer_id TEXT, "
           "reviewer_name TEXT, "
           "status TEXT NOT NULL)");

  std::ostringstream oss;
  oss << "[SqliteStagedRequestStore] READY path=" << db_path << " table=" << table_;
  util::Logger::Info(oss.str());
}

void SqliteStagedRequestStore::UpsertLocked(const StagedRequest& request) {
  auto stmt = db_.Prepare(std::string("INSERT OR REPLACE INTO ") + table_ + " (" +
                          kRequestColumns + ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
  BindRequestColumns(stmt, 1, request);
  stmt.Run();
}

void SqliteStagedRequestStore::DeleteLocked(const std::string& request_id) {
  auto stmt = db_.Prepare("DELETE FROM " + table_ + " WHERE id = ?");
  stmt.BindText(1, request_id);
  stmt.Run();
}

void SqliteStagedRequestStore::Save(const StagedRequest& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  UpsertLocked(request);
}

void SqliteStagedRequestStore::Delete(const std::string& request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  DeleteLocked(request_id);
}

std::vector<StagedRequest> SqliteStagedRequestStore::LoadAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto stmt = db_.Prepare(std::string("SELECT ") + kRequestColumns + " FROM " + table_ +
                          " ORDER BY timestamp_ms ASC");
  std::vector<StagedRequest> out;
  while (stmt.Step()) out.push_back(ReadRequestColumns(stmt, 0));
  return out;
}

void SqliteStagedRequestStore::SaveAll(const std::vector<StagedRequest>& requests) {
  if (requests.empty()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteTransaction tx(db_);
  for (const auto& r : requests) UpsertLocked(r);
  tx.Commit();
}

void SqliteStagedRequestStore::DeleteAll(const std::vector<std::string>& request_ids) {
  if (request_ids.empty()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteTransaction tx(db_);
  for (const auto& id : request_ids) DeleteLocked(id);
  tx.Commit();
}

}  // namespace stagegate::store
