// Repository: Stagegate
// Component: Staging Metrics
// Purpose: Lifecycle counters and review-time statistics, fed by the event bus.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_TELEMETRY_STAGING_METRICS_HPP_
#define STAGEGATE_TELEMETRY_STAGING_METRICS_HPP_

#include <atomic>
#include <cstdint>
#include <string>

#include "stagegate/events/LifecycleEvent.hpp"

namespace stagegate::telemetry {

// Auto-approvals are counted separately and do not contribute to review-time
// statistics or the approval/rejection rates; only reviewed requests do.
class StagingMetrics : public events::ILifecycleListener {
 public:
  struct Snapshot {
    uint64_t staged = 0;
    uint64_t approved = 0;
    uint64_t rejected = 0;
    uint64_t auto_approved = 0;
    uint64_t reviewed = 0;
    int64_t total_review_ms = 0;
  };

  StagingMetrics() = default;

  StagingMetrics(const StagingMetrics&) = delete;
  StagingMetrics& operator=(const StagingMetrics&) = delete;

  void OnStaged(const events::LifecycleEvent& event) override;
  void OnApproved(const events::LifecycleEvent& event) override;
  void OnRejected(const events::LifecycleEvent& event) override;

  Snapshot Get() const;

  int64_t AverageReviewTimeMs() const;
  // Percentages in [0, 100]; 0 when nothing has been reviewed.
  double ApprovalRate() const;
  double RejectionRate() const;

  // "N/A" for zero, then "42s", "3m 5s", "2h 10m".
  static std::string FormatDuration(int64_t ms);
  std::string FormattedAverageReviewTime() const;

  // Human-readable block; expired_total is owned by the engine.
  std::string Report(uint64_t expired_total) const;

  // Prometheus text exposition of the same counters.
  std::string PrometheusText(uint64_t expired_total) const;

 private:
  std::atomic<uint64_t> staged_{0};
  std::atomic<uint64_t> approved_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> auto_approved_{0};
  std::atomic<uint64_t> reviewed_{0};
  std::atomic<int64_t> total_review_ms_{0};
};

}  // namespace stagegate::telemetry

#endif  // STAGEGATE_TELEMETRY_STAGING_METRICS_HPP_
