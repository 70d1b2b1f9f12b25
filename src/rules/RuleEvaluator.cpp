// Repository: Stagegate
// Component: Rule Evaluator
// Purpose: Time-window auto-approval and elapsed-time expiration.
// Copyright (c) 2026 Stagegate

#include "stagegate/rules/RuleEvaluator.hpp"

namespace stagegate::rules {

bool RuleEvaluator::ShouldAutoApprove(int64_t now) const {
  if (!config_.auto_approve_enabled) return false;
  const int64_t start = config_.auto_approve_start_ms;
  const int64_t end = config_.auto_approve_end_ms;
  if (start < end) {
    return now > start && now < end;
  }
  // Wraps midnight (e.g. 22:00 - 06:00).
  return now > start || now < end;
}

bool RuleEvaluator::IsExpired(const staging::StagedRequest& request,
                              int64_t now_utc_ms) const {
  if (!config_.expiration_enabled) return false;
  return now_utc_ms - request.timestamp_ms > config_.expiration_ms;
}

}  // namespace stagegate::rules
