// Repository: Stagegate
// Component: Staged Request
// Purpose: The unit of review. An intercepted command awaiting (or past) a decision.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STAGING_STAGED_REQUEST_HPP_
#define STAGEGATE_STAGING_STAGED_REQUEST_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace stagegate::staging {

enum class RequestStatus {
  kPending = 0,
  kApproved = 1,
  kRejected = 2,
};

// Stable wire names: PENDING, APPROVED, REJECTED.
const char* RequestStatusName(RequestStatus status);
bool ParseRequestStatus(const std::string& name, RequestStatus* out);

// An actor: requester, reviewer, or the privileged console.
struct Principal {
  std::string id;
  std::string name;

  bool operator==(const Principal& other) const { return id == other.id; }
  bool operator!=(const Principal& other) const { return !(*this == other); }
};

// Sentinel identity for non-interactive callers (schedules, host console) and
// the privileged context used when a requester is no longer reachable.
inline constexpr char kConsolePrincipalId[] = "00000000-0000-0000-0000-000000000000";
inline constexpr char kConsolePrincipalName[] = "CONSOLE";
Principal ConsolePrincipal();

// Identity, origin, payload and timestamp are fixed at creation. Disposition
// fields change once, PENDING → APPROVED | REJECTED, and only inside
// LifecycleEngine. An empty reviewer on a decided request means the system
// decided it.
struct StagedRequest {
  static constexpr uint32_t kSchemaVersion = 1u;

  std::string id;
  Principal requester;
  std::string command_text;
  int64_t timestamp_ms = 0;

  RequestStatus status = RequestStatus::kPending;
  std::optional<Principal> reviewer;
  std::optional<std::string> justification;

  // New PENDING request with a fresh UUID v4.
  static StagedRequest Create(Principal requester, std::string command_text,
                              int64_t now_utc_ms);

  // Serialize to single-line JSON (one line of JSONL). Nullable fields are
  // written as JSON null.
  std::string ToJsonLine() const;
  // Parse from single line; returns false if line is corrupt/incomplete.
  static bool FromJsonLine(const std::string& line, StagedRequest& out);
};

std::string GenerateUuidV4();

}  // namespace stagegate::staging

#endif  // STAGEGATE_STAGING_STAGED_REQUEST_HPP_
