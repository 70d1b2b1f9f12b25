// Repository: Stagegate
// Component: SQLite connection wrapper
// Copyright (c) 2026 Stagegate

#include "stagegate/store/SqliteDb.hpp"

#include <cctype>
#include <sstream>

#include <sqlite3.h>

#include "stagegate/store/StorageError.hpp"
#include "stagegate/util/Logger.hpp"

namespace stagegate::store {

namespace {

constexpr int kBusyTimeoutMs = 5000;

[[noreturn]] void ThrowSqlite(sqlite3* db, const std::string& what) {
  throw StorageError("sqlite: " + what + ": " + (db ? sqlite3_errmsg(db) : "no handle"));
}

}  // namespace

// -----------------------------------------------------------------------------
// SqliteStatement
// -----------------------------------------------------------------------------

void SqliteStatement::Finalize(sqlite3_stmt* stmt) {
  if (stmt) sqlite3_finalize(stmt);
}

void SqliteStatement::BindText(int index, const std::string& value) {
  if (sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK)
    ThrowSqlite(db_, "bind text");
}

void SqliteStatement::BindNullableText(int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    BindText(index, *value);
    return;
  }
  if (sqlite3_bind_null(stmt_.get(), index) != SQLITE_OK)
    ThrowSqlite(db_, "bind null");
}

void SqliteStatement::BindInt64(int index, int64_t value) {
  if (sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value)) != SQLITE_OK)
    ThrowSqlite(db_, "bind int64");
}

bool SqliteStatement::Step() {
  const int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  ThrowSqlite(db_, "step");
}

void SqliteStatement::Run() {
  while (Step()) {
  }
}

void SqliteStatement::Reset() {
  sqlite3_reset(stmt_.get());
  sqlite3_clear_bindings(stmt_.get());
}

std::string SqliteStatement::ColumnText(int col) const {
  const unsigned char* text = sqlite3_column_text(stmt_.get(), col);
  if (text == nullptr) return std::string();
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), col)));
}

std::optional<std::string> SqliteStatement::ColumnNullableText(int col) const {
  if (sqlite3_column_type(stmt_.get(), col) == SQLITE_NULL) return std::nullopt;
  return ColumnText(col);
}

int64_t SqliteStatement::ColumnInt64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_.get(), col));
}

// -----------------------------------------------------------------------------
// SqliteDb
// -----------------------------------------------------------------------------

SqliteDb::SqliteDb(const std::string& path) : path_(path) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = "open " + path + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError("sqlite: " + msg);
  }
  sqlite3_busy_timeout(db_, kBusyTimeoutMs);

  std::ostringstream oss;
  oss << "[SqliteDb] OPEN path=" << path;
  util::Logger::Debug(oss.str());
}

SqliteDb::~SqliteDb() {
  if (db_) sqlite3_close(db_);
}

void SqliteDb::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StorageError("sqlite: exec: " + msg);
  }
}

SqliteStatement SqliteDb::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    ThrowSqlite(db_, "prepare");
  return SqliteStatement(db_, stmt);
}

// -----------------------------------------------------------------------------
// SqliteTransaction
// -----------------------------------------------------------------------------

SqliteTransaction::SqliteTransaction(SqliteDb& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE");
}

SqliteTransaction::~SqliteTransaction() {
  if (done_) return;
  try {
    db_.Exec("ROLLBACK");
  } catch (const StorageError& e) {
    util::Logger::Error(std::string("[SqliteDb] ROLLBACK_FAILED error=") + e.what());
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT");
  done_ = true;
}

std::string CheckedTablePrefix(const std::string& prefix) {
  for (char c : prefix) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
      throw StorageError("invalid table prefix: " + prefix);
  }
  return prefix;
}

}  // namespace stagegate::store
