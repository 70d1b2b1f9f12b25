// Repository: Stagegate
// Component: SQLite Staged Request Store
// Purpose: Relational backend. Table <prefix>staged_requests, batch operations
//          in a single transaction.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_SQLITE_STAGED_REQUEST_STORE_HPP_
#define STAGEGATE_STORE_SQLITE_STAGED_REQUEST_STORE_HPP_

#include <mutex>
#include <string>
#include <vector>

#include "stagegate/store/IStagedRequestStore.hpp"
#include "stagegate/store/SqliteDb.hpp"

namespace stagegate::store {

class SqliteStagedRequestStore : public IStagedRequestStore {
 public:
  static constexpr const char* kDefaultTablePrefix = "stagegate_";

  // Opens db_path and creates the table if missing. Throws StorageError.
  explicit SqliteStagedRequestStore(const std::string& db_path,
                                    const std::string& table_prefix = kDefaultTablePrefix);

  void Save(const staging::StagedRequest& request) override;
  void Delete(const std::string& request_id) override;
  std::vector<staging::StagedRequest> LoadAll() override;
  void SaveAll(const std::vector<staging::StagedRequest>& requests) override;
  void DeleteAll(const std::vector<std::string>& request_ids) override;

  const std::string& TableName() const { return table_; }

 private:
  void UpsertLocked(const staging::StagedRequest& request);
  void DeleteLocked(const std::string& request_id);

  std::mutex mutex_;
  SqliteDb db_;
  std::string table_;
};

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_SQLITE_STAGED_REQUEST_STORE_HPP_
