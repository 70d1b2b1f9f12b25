// Repository: Stagegate
// Component: Staging Metrics
// Copyright (c) 2026 Stagegate

#include "stagegate/telemetry/StagingMetrics.hpp"

#include <iomanip>
#include <sstream>

namespace stagegate::telemetry {

void StagingMetrics::OnStaged(const events::LifecycleEvent& /*event*/) {
  staged_.fetch_add(1, std::memory_order_relaxed);
}

void StagingMetrics::OnApproved(const events::LifecycleEvent& event) {
  if (event.auto_approved) {
    auto_approved_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  approved_.fetch_add(1, std::memory_order_relaxed);
  reviewed_.fetch_add(1, std::memory_order_relaxed);
  total_review_ms_.fetch_add(event.review_elapsed_ms, std::memory_order_relaxed);
}

void StagingMetrics::OnRejected(const events::LifecycleEvent& event) {
  rejected_.fetch_add(1, std::memory_order_relaxed);
  reviewed_.fetch_add(1, std::memory_order_relaxed);
  total_review_ms_.fetch_add(event.review_elapsed_ms, std::memory_order_relaxed);
}

StagingMetrics::Snapshot StagingMetrics::Get() const {
  Snapshot s;
  s.staged = staged_.load(std::memory_order_relaxed);
  s.approved = approved_.load(std::memory_order_relaxed);
  s.rejected = rejected_.load(std::memory_order_relaxed);
  s.auto_approved = auto_approved_.load(std::memory_order_relaxed);
  s.reviewed = reviewed_.load(std::memory_order_relaxed);
  s.total_review_ms = total_review_ms_.load(std::memory_order_relaxed);
  return s;
}

int64_t StagingMetrics::AverageReviewTimeMs() const {
  const uint64_t reviewed = reviewed_.load(std::memory_order_relaxed);
  if (reviewed == 0) return 0;
  return total_review_ms_.load(std::memory_order_relaxed) / static_cast<int64_t>(reviewed);
}

double StagingMetrics::ApprovalRate() const {
  const uint64_t reviewed = reviewed_.load(std::memory_order_relaxed);
  if (reviewed == 0) return 0.0;
  return approved_.load(std::memory_order_relaxed) * 100.0 / static_cast<double>(reviewed);
}

double StagingMetrics::RejectionRate() const {
  const uint64_t reviewed = reviewed_.load(std::memory_order_relaxed);
  if (reviewed == 0) return 0.0;
  return rejected_.load(std::memory_order_relaxed) * 100.0 / static_cast<double>(reviewed);
}

std::string StagingMetrics::FormatDuration(int64_t ms) {
  if (ms <= 0) return "N/A";
  const int64_t seconds = ms / 1000;
  if (seconds < 60) return std::to_string(seconds) + "s";
  const int64_t minutes = seconds / 60;
  if (minutes < 60) return std::to_string(minutes) + "m " + std::to_string(seconds % 60) + "s";
  return std::to_string(minutes / 60) + "h " + std::to_string(minutes % 60) + "m";
}

std::string StagingMetrics::FormattedAverageReviewTime() const {
  return FormatDuration(AverageReviewTimeMs());
}

std::string StagingMetrics::Report(uint64_t expired_total) const {
  const Snapshot s = Get();
  std::ostringstream o;
  o << std::fixed << std::setprecision(1);
  o << "Staging Metrics:\n"
    << "  Staged: " << s.staged << "\n"
    << "  Approved: " << s.approved << "\n"
    << "  Rejected: " << s.rejected << "\n"
    << "  Auto-Approved: " << s.auto_approved << "\n"
    << "  Expired: " << expired_total << "\n"
    << "  Approval Rate: " << ApprovalRate() << "%\n"
    << "  Rejection Rate: " << RejectionRate() << "%\n"
    << "  Average Review Time: " << FormattedAverageReviewTime() << "\n";
  return o.str();
}

std::string StagingMetrics::PrometheusText(uint64_t expired_total) const {
  const Snapshot s = Get();
  std::ostringstream o;
  auto counter = [&o](const char* name, const char* help, uint64_t value) {
    o << "# HELP " << name << " " << help << "\n"
      << "# TYPE " << name << " counter\n"
      << name << " " << value << "\n";
  };
  counter("stagegate_requests_staged_total", "Requests queued for review.", s.staged);
  counter("stagegate_requests_approved_total", "Requests approved by a reviewer or the system.",
          s.approved);
  counter("stagegate_requests_rejected_total", "Requests rejected.", s.rejected);
  counter("stagegate_requests_auto_approved_total", "Requests approved by the time-window rule.",
          s.auto_approved);
  counter("stagegate_requests_expired_total", "Pending requests removed by expiration.",
          expired_total);
  o << "# HELP stagegate_review_time_ms_avg Mean time from staging to decision.\n"
    << "# TYPE stagegate_review_time_ms_avg gauge\n"
    << "stagegate_review_time_ms_avg " << AverageReviewTimeMs() << "\n";
  return o.str();
}

}  // namespace stagegate::telemetry
