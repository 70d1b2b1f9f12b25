// Repository: Stagegate
// Component: Rule Configuration
// Purpose: Auto-approval window and expiration settings. Read-only after load.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_RULES_RULE_CONFIG_HPP_
#define STAGEGATE_RULES_RULE_CONFIG_HPP_

#include <cstdint>
#include <string>

namespace stagegate::rules {

struct RuleConfig {
  // Auto-approval: window [start, end) as milliseconds since local midnight.
  // start >= end means the window wraps midnight.
  bool auto_approve_enabled = false;
  int64_t auto_approve_start_ms = 0;                   // 00:00
  int64_t auto_approve_end_ms = 6LL * 60 * 60 * 1000;  // 06:00

  bool expiration_enabled = true;
  int64_t expiration_ms = 1440LL * 60 * 1000;  // 24h
};

// Parses "HH:MM" or "HH:MM:SS" into milliseconds since midnight.
// Returns false (out untouched) on malformed or out-of-range input.
bool ParseTimeOfDay(const std::string& text, int64_t* out_ms);

// Inverse of ParseTimeOfDay; always "HH:MM:SS".
std::string FormatTimeOfDay(int64_t ms);

// Applies "HH:MM" strings to config. On a malformed value auto-approval is
// disabled and a warning is logged; the window fields keep their defaults.
void ApplyAutoApproveWindow(RuleConfig& config, bool enabled,
                            const std::string& start, const std::string& end);

}  // namespace stagegate::rules

#endif  // STAGEGATE_RULES_RULE_CONFIG_HPP_
