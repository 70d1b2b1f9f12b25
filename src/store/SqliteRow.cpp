// Repository: Stagegate
// Component: SQLite row mapping for StagedRequest
// Copyright (c) 2026 Stagegate

#include "stagegate/store/SqliteRow.hpp"

namespace stagegate::store {

using staging::Principal;
using staging::StagedRequest;

void BindRequestColumns(SqliteStatement& stmt, int i, const StagedRequest& r) {
  stmt.BindText(i + 0, r.id);
  stmt.BindText(i + 1, r.requester.id);
  stmt.BindText(i + 2, r.requester.name);
  stmt.BindText(i + 3, r.command_text);
  stmt.BindInt64(i + 4, r.timestamp_ms);
  stmt.BindNullableText(i + 5, r.justification);
  stmt.BindNullableText(i + 6, r.reviewer ? std::optional<std::string>(r.reviewer->id)
                                          : std::nullopt);
  stmt.BindNullableText(i + 7, r.reviewer ? std::optional<std::string>(r.reviewer->name)
                                          : std::nullopt);
  stmt.BindText(i + 8, staging::RequestStatusName(r.status));
}

StagedRequest ReadRequestColumns(const SqliteStatement& stmt, int c) {
  StagedRequest r;
  r.id = stmt.ColumnText(c + 0);
  r.requester.id = stmt.ColumnText(c + 1);
  r.requester.name = stmt.ColumnText(c + 2);
  r.command_text = stmt.ColumnText(c + 3);
  r.timestamp_ms = stmt.ColumnInt64(c + 4);
  r.justification = stmt.ColumnNullableText(c + 5);
  auto reviewer_id = stmt.ColumnNullableText(c + 6);
  if (reviewer_id.has_value())
    r.reviewer = Principal{*reviewer_id, stmt.ColumnNullableText(c + 7).value_or("")};
  if (!staging::ParseRequestStatus(stmt.ColumnText(c + 8), &r.status))
    r.status = staging::RequestStatus::kPending;
  return r;
}

}  // namespace stagegate::store
