// Repository: Stagegate
// Component: SQLite row mapping for StagedRequest
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_SQLITE_ROW_HPP_
#define STAGEGATE_STORE_SQLITE_ROW_HPP_

#include "stagegate/staging/StagedRequest.hpp"
#include "stagegate/store/SqliteDb.hpp"

namespace stagegate::store {

// Column order shared by both SQLite backends:
//   id, requester_id, requester_name, command_text, timestamp_ms,
//   justification, reviewer_id, reviewer_name, status
inline constexpr const char* kRequestColumns =
    "id, requester_id, requester_name, command_text, timestamp_ms, "
    "justification, reviewer_id, reviewer_name, status";

// Binds the nine request columns starting at parameter first_index.
void BindRequestColumns(SqliteStatement& stmt, int first_index,
                        const staging::StagedRequest& request);

// Reads the nine request columns starting at column first_col. Unknown
// status text reads as PENDING.
staging::StagedRequest ReadRequestColumns(const SqliteStatement& stmt, int first_col);

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_SQLITE_ROW_HPP_
