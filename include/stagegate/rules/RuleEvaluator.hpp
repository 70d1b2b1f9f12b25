// Repository: Stagegate
// Component: Rule Evaluator
// Purpose: Stateless predicates deciding auto-approval and expiration.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_RULES_RULE_EVALUATOR_HPP_
#define STAGEGATE_RULES_RULE_EVALUATOR_HPP_

#include <cstdint>

#include "stagegate/rules/RuleConfig.hpp"
#include "stagegate/staging/StagedRequest.hpp"

namespace stagegate::rules {

// Pure functions of (config, inputs). Safe to call from any thread.
class RuleEvaluator {
 public:
  explicit RuleEvaluator(RuleConfig config) : config_(config) {}

  // Window bounds are exclusive on both ends: now == start and now == end are
  // never in-window, for plain and midnight-wrapping windows alike.
  [[nodiscard]] bool ShouldAutoApprove(int64_t local_time_of_day_ms) const;

  // True iff expiration is enabled and now - timestamp > expiration (strict).
  [[nodiscard]] bool IsExpired(const staging::StagedRequest& request,
                               int64_t now_utc_ms) const;

  const RuleConfig& config() const { return config_; }

 private:
  const RuleConfig config_;
};

}  // namespace stagegate::rules

#endif  // STAGEGATE_RULES_RULE_EVALUATOR_HPP_
