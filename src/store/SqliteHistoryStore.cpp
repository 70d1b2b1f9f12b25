// Repository: Stagegate
// Component: SQLite History Store
// Copyright (c) 2026 Stagegate

#include "stagegate/store/SqliteHistoryStore.hpp"

#include <sstream>

#include "stagegate/store/SqliteRow.hpp"
#include "stagegate/util/Logger.hpp"

namespace stagegate::store {

using staging::StagedRequest;

SqliteHistoryStore::SqliteHistoryStore(const std::string& db_path,
                                       const std::string& table_prefix)
    : db_(db_path), table_(CheckedTablePrefix(table_prefix) + "command_history") {
  db_.Exec("CREATE TABLE IF NOT EXISTS " + table_ + " ("
           "id TEXT NOT NULL, "
           "requester_id TEXT NOT NULL, "
           "requester_name TEXT NOT NULL, "
           "command_text TEXT NOT NULL, "
           "timestamp_ms INTEGER NOT NULL, "
           "justification TEXT, "
           "reviewer_id TEXT, "
           "reviewer_name TEXT, "
           "status TEXT NOT NULL, "
           "PRIMARY KEY (id, requester_id))");
  db_.Exec("CREATE INDEX IF NOT EXISTS " + table_ + "_requester_ts ON " + table_ +
           " (requester_id, timestamp_ms)");
  db_.Exec("CREATE INDEX IF NOT EXISTS " + table_ + "_reviewer ON " + table_ +
           " (reviewer_id)");

  std::ostringstream oss;
  oss << "[SqliteHistoryStore] READY path=" << db_path << " table=" << table_;
  util::Logger::Info(oss.str());
}

void SqliteHistoryStore::Save(const std::string& requester_id,
                              const std::vector<StagedRequest>& history) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteTransaction tx(db_);
  {
    auto del = db_.Prepare("DELETE FROM " + table_ + " WHERE requester_id = ?");
    del.BindText(1, requester_id);
    del.Run();
  }
  auto ins = db_.Prepare(std::string("INSERT OR REPLACE INTO ") + table_ + " (" +
                         kRequestColumns + ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
  for (const auto& r : history) {
    // Rows are keyed by the owning requester even if a record says otherwise.
    StagedRequest row = r;
    row.requester.id = requester_id;
    BindRequestColumns(ins, 1, row);
    ins.Run();
    ins.Reset();
  }
  tx.Commit();
}

std::vector<StagedRequest> SqliteHistoryStore::Load(const std::string& requester_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto stmt = db_.Prepare(std::string("SELECT ") + kRequestColumns + " FROM " + table_ +
                          " WHERE requester_id = ? ORDER BY timestamp_ms DESC");
  stmt.BindText(1, requester_id);
  std::vector<StagedRequest> out;
  while (stmt.Step()) out.push_back(ReadRequestColumns(stmt, 0));
  return out;
}

HistoryMap SqliteHistoryStore::LoadAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto stmt = db_.Prepare(std::string("SELECT ") + kRequestColumns + " FROM " + table_ +
                          " ORDER BY requester_id, timestamp_ms DESC");
  HistoryMap out;
  while (stmt.Step()) {
    StagedRequest r = ReadRequestColumns(stmt, 0);
    out[r.requester.id].push_back(std::move(r));
  }
  return out;
}

void SqliteHistoryStore::Delete(const std::string& requester_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto stmt = db_.Prepare("DELETE FROM " + table_ + " WHERE requester_id = ?");
  stmt.BindText(1, requester_id);
  stmt.Run();
}

}  // namespace stagegate::store
