// Repository: Stagegate
// Component: Rule Evaluator contract tests
// Purpose: Auto-approve window bounds (plain and midnight-wrapping), strict
//          expiration, and time-of-day parsing.
// Copyright (c) 2026 Stagegate

#include <gtest/gtest.h>

#include "stagegate/rules/RuleConfig.hpp"
#include "stagegate/rules/RuleEvaluator.hpp"

namespace stagegate::rules {
namespace {

constexpr int64_t kHourMs = 60LL * 60 * 1000;
constexpr int64_t kMinuteMs = 60LL * 1000;

RuleConfig WindowConfig(int64_t start_ms, int64_t end_ms) {
  RuleConfig c;
  c.auto_approve_enabled = true;
  c.auto_approve_start_ms = start_ms;
  c.auto_approve_end_ms = end_ms;
  return c;
}

// =============================================================================
// Auto-approve window
// =============================================================================

TEST(RuleEvaluatorContract, DisabledWindowNeverApproves) {
  RuleConfig c = WindowConfig(0, 6 * kHourMs);
  c.auto_approve_enabled = false;
  RuleEvaluator rules(c);
  EXPECT_FALSE(rules.ShouldAutoApprove(3 * kHourMs));
}

TEST(RuleEvaluatorContract, PlainWindowBoundsAreExclusive) {
  RuleEvaluator rules(WindowConfig(1 * kHourMs, 6 * kHourMs));
  EXPECT_FALSE(rules.ShouldAutoApprove(1 * kHourMs)) << "start is not in-window";
  EXPECT_TRUE(rules.ShouldAutoApprove(1 * kHourMs + 1));
  EXPECT_TRUE(rules.ShouldAutoApprove(3 * kHourMs));
  EXPECT_TRUE(rules.ShouldAutoApprove(6 * kHourMs - 1));
  EXPECT_FALSE(rules.ShouldAutoApprove(6 * kHourMs)) << "end is not in-window";
  EXPECT_FALSE(rules.ShouldAutoApprove(12 * kHourMs));
}

TEST(RuleEvaluatorContract, WrappingWindowSpansMidnight) {
  RuleEvaluator rules(WindowConfig(22 * kHourMs, 6 * kHourMs));
  EXPECT_TRUE(rules.ShouldAutoApprove(23 * kHourMs));
  EXPECT_TRUE(rules.ShouldAutoApprove(0));
  EXPECT_TRUE(rules.ShouldAutoApprove(5 * kHourMs + 59 * kMinuteMs));
  EXPECT_FALSE(rules.ShouldAutoApprove(22 * kHourMs));
  EXPECT_FALSE(rules.ShouldAutoApprove(6 * kHourMs));
  EXPECT_FALSE(rules.ShouldAutoApprove(12 * kHourMs));
}

// =============================================================================
// Expiration
// =============================================================================

TEST(RuleEvaluatorContract, ExpirationIsStrictlyGreaterThanDuration) {
  RuleConfig c;
  c.expiration_enabled = true;
  c.expiration_ms = 10 * kMinuteMs;
  RuleEvaluator rules(c);

  staging::StagedRequest r;
  r.timestamp_ms = 1'000'000;
  EXPECT_FALSE(rules.IsExpired(r, r.timestamp_ms + 10 * kMinuteMs));
  EXPECT_TRUE(rules.IsExpired(r, r.timestamp_ms + 10 * kMinuteMs + 1));
}

TEST(RuleEvaluatorContract, DisabledExpirationNeverExpires) {
  RuleConfig c;
  c.expiration_enabled = false;
  c.expiration_ms = 1;
  RuleEvaluator rules(c);

  staging::StagedRequest r;
  r.timestamp_ms = 0;
  EXPECT_FALSE(rules.IsExpired(r, 365LL * 24 * kHourMs));
}

TEST(RuleEvaluatorContract, DefaultsMatchDocumentedValues) {
  RuleEvaluator rules{RuleConfig{}};
  EXPECT_FALSE(rules.config().auto_approve_enabled);
  EXPECT_EQ(rules.config().auto_approve_start_ms, 0);
  EXPECT_EQ(rules.config().auto_approve_end_ms, 6 * kHourMs);
  EXPECT_TRUE(rules.config().expiration_enabled);
  EXPECT_EQ(rules.config().expiration_ms, 1440 * kMinuteMs);
}

// =============================================================================
// Time-of-day parsing
// =============================================================================

TEST(RuleConfigTest, ParsesHoursMinutesAndSeconds) {
  int64_t ms = -1;
  ASSERT_TRUE(ParseTimeOfDay("22:30", &ms));
  EXPECT_EQ(ms, 22 * kHourMs + 30 * kMinuteMs);
  ASSERT_TRUE(ParseTimeOfDay("06:00:15", &ms));
  EXPECT_EQ(ms, 6 * kHourMs + 15 * 1000);
}

TEST(RuleConfigTest, RejectsMalformedTimes) {
  int64_t ms = 0;
  EXPECT_FALSE(ParseTimeOfDay("", &ms));
  EXPECT_FALSE(ParseTimeOfDay("24:00", &ms));
  EXPECT_FALSE(ParseTimeOfDay("12:60", &ms));
  EXPECT_FALSE(ParseTimeOfDay("7:00", &ms));
  EXPECT_FALSE(ParseTimeOfDay("ab:cd", &ms));
  EXPECT_FALSE(ParseTimeOfDay("12-00", &ms));
}

TEST(RuleConfigTest, FormatsTimeOfDay) {
  EXPECT_EQ(FormatTimeOfDay(0), "00:00:00");
  EXPECT_EQ(FormatTimeOfDay(22 * kHourMs + 5 * kMinuteMs + 9000), "22:05:09");
}

TEST(RuleConfigTest, InvalidWindowDisablesAutoApprove) {
  RuleConfig c;
  ApplyAutoApproveWindow(c, true, "25:00", "06:00");
  EXPECT_FALSE(c.auto_approve_enabled);

  ApplyAutoApproveWindow(c, true, "22:00", "06:00");
  EXPECT_TRUE(c.auto_approve_enabled);
  EXPECT_EQ(c.auto_approve_start_ms, 22 * kHourMs);
  EXPECT_EQ(c.auto_approve_end_ms, 6 * kHourMs);
}

}  // namespace
}  // namespace stagegate::rules
