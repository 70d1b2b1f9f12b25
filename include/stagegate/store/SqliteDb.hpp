// Repository: Stagegate
// Component: SQLite connection wrapper
// Purpose: RAII ownership of sqlite3 handles and prepared statements; every
//          failure surfaces as StorageError.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_SQLITE_DB_HPP_
#define STAGEGATE_STORE_SQLITE_DB_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace stagegate::store {

class SqliteStatement {
 public:
  SqliteStatement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt, &Finalize) {}

  void BindText(int index, const std::string& value);
  void BindNullableText(int index, const std::optional<std::string>& value);
  void BindInt64(int index, int64_t value);

  // Returns true while a row is available; false when done. Throws on error.
  bool Step();
  // Step() until done; for statements that return no rows.
  void Run();
  void Reset();

  std::string ColumnText(int col) const;
  std::optional<std::string> ColumnNullableText(int col) const;
  int64_t ColumnInt64(int col) const;

 private:
  static void Finalize(sqlite3_stmt* stmt);

  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, void (*)(sqlite3_stmt*)> stmt_;
};

class SqliteDb {
 public:
  // Opens (creating if needed) the database file. Throws StorageError.
  explicit SqliteDb(const std::string& path);
  ~SqliteDb();

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;

  void Exec(const std::string& sql);
  SqliteStatement Prepare(const std::string& sql);

  const std::string& Path() const { return path_; }

 private:
  std::string path_;
  sqlite3* db_ = nullptr;
};

// BEGIN on construction; ROLLBACK on destruction unless Commit() ran.
class SqliteTransaction {
 public:
  explicit SqliteTransaction(SqliteDb& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&) = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  SqliteDb& db_;
  bool done_ = false;
};

// Table prefixes are spliced into SQL text; only [A-Za-z0-9_] is accepted.
// Throws StorageError otherwise.
std::string CheckedTablePrefix(const std::string& prefix);

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_SQLITE_DB_HPP_
