// Repository: Stagegate
// Component: Rule Configuration
// Purpose: Time-of-day parsing for the auto-approval window.
// Copyright (c) 2026 Stagegate

#include "stagegate/rules/RuleConfig.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>

#include "stagegate/util/Logger.hpp"

namespace stagegate::rules {

namespace {

bool ParseTwoDigits(const std::string& text, size_t pos, int* out) {
  if (pos + 2 > text.size()) return false;
  if (!std::isdigit(static_cast<unsigned char>(text[pos])) ||
      !std::isdigit(static_cast<unsigned char>(text[pos + 1])))
    return false;
  *out = (text[pos] - '0') * 10 + (text[pos + 1] - '0');
  return true;
}

}  // namespace

bool ParseTimeOfDay(const std::string& text, int64_t* out_ms) {
  if (text.size() != 5 && text.size() != 8) return false;
  int h = 0, m = 0, s = 0;
  if (!ParseTwoDigits(text, 0, &h) || text[2] != ':' || !ParseTwoDigits(text, 3, &m))
    return false;
  if (text.size() == 8 && (text[5] != ':' || !ParseTwoDigits(text, 6, &s)))
    return false;
  if (h > 23 || m > 59 || s > 59) return false;
  *out_ms = ((static_cast<int64_t>(h) * 60 + m) * 60 + s) * 1000;
  return true;
}

std::string FormatTimeOfDay(int64_t ms) {
  const int64_t total_s = ms / 1000;
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d",
                static_cast<int>(total_s / 3600),
                static_cast<int>((total_s / 60) % 60),
                static_cast<int>(total_s % 60));
  return buf;
}

void ApplyAutoApproveWindow(RuleConfig& config, bool enabled,
                            const std::string& start, const std::string& end) {
  int64_t start_ms = 0;
  int64_t end_ms = 0;
  if (!ParseTimeOfDay(start, &start_ms) || !ParseTimeOfDay(end, &end_ms)) {
    std::ostringstream oss;
    oss << "[RuleConfig] INVALID_AUTO_APPROVE_TIME start=" << start << " end=" << end
        << " auto_approve=disabled";
    util::Logger::Warn(oss.str());
    config.auto_approve_enabled = false;
    return;
  }
  config.auto_approve_enabled = enabled;
  config.auto_approve_start_ms = start_ms;
  config.auto_approve_end_ms = end_ms;
}

}  // namespace stagegate::rules
