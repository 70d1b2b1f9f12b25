// Repository: Stagegate
// Component: SQLite History Store
// Purpose: Relational history backend, table <prefix>command_history.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_SQLITE_HISTORY_STORE_HPP_
#define STAGEGATE_STORE_SQLITE_HISTORY_STORE_HPP_

#include <mutex>
#include <string>

#include "stagegate/store/IHistoryStore.hpp"
#include "stagegate/store/SqliteDb.hpp"

namespace stagegate::store {

class SqliteHistoryStore : public IHistoryStore {
 public:
  static constexpr const char* kDefaultTablePrefix = "stagegate_";

  explicit SqliteHistoryStore(const std::string& db_path,
                              const std::string& table_prefix = kDefaultTablePrefix);

  // Delete-then-insert of the requester's rows in one transaction.
  void Save(const std::string& requester_id,
            const std::vector<staging::StagedRequest>& history) override;
  std::vector<staging::StagedRequest> Load(const std::string& requester_id) override;
  HistoryMap LoadAll() override;
  void Delete(const std::string& requester_id) override;

  const std::string& TableName() const { return table_; }

 private:
  std::mutex mutex_;
  SqliteDb db_;
  std::string table_;
};

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_SQLITE_HISTORY_STORE_HPP_
