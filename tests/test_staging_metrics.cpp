// Repository: Stagegate
// Component: Staging metrics unit tests
// Copyright (c) 2026 Stagegate

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "stagegate/events/EventBus.hpp"
#include "stagegate/telemetry/StagingMetrics.hpp"

namespace stagegate::telemetry {
namespace {

using events::LifecycleEvent;
using events::LifecycleEventKind;

LifecycleEvent Event(LifecycleEventKind kind, int64_t elapsed_ms, bool auto_approved = false) {
  LifecycleEvent e;
  e.kind = kind;
  e.review_elapsed_ms = elapsed_ms;
  e.auto_approved = auto_approved;
  e.system_actor = auto_approved;
  return e;
}

TEST(StagingMetricsTest, CountsAndRatesExcludeAutoApprovals) {
  StagingMetrics m;
  m.OnStaged(Event(LifecycleEventKind::kStaged, 0));
  m.OnStaged(Event(LifecycleEventKind::kStaged, 0));
  m.OnStaged(Event(LifecycleEventKind::kStaged, 0));
  m.OnApproved(Event(LifecycleEventKind::kApproved, 10'000));
  m.OnApproved(Event(LifecycleEventKind::kApproved, 20'000));
  m.OnRejected(Event(LifecycleEventKind::kRejected, 30'000));
  m.OnApproved(Event(LifecycleEventKind::kApproved, 0, /*auto_approved=*/true));

  auto s = m.Get();
  EXPECT_EQ(s.staged, 3u);
  EXPECT_EQ(s.approved, 2u);
  EXPECT_EQ(s.rejected, 1u);
  EXPECT_EQ(s.auto_approved, 1u);
  EXPECT_EQ(s.reviewed, 3u);
  EXPECT_EQ(m.AverageReviewTimeMs(), 20'000);
  EXPECT_NEAR(m.ApprovalRate(), 66.666, 0.01);
  EXPECT_NEAR(m.RejectionRate(), 33.333, 0.01);
}

TEST(StagingMetricsTest, EmptyMetricsReportZeroesAndNA) {
  StagingMetrics m;
  EXPECT_EQ(m.AverageReviewTimeMs(), 0);
  EXPECT_EQ(m.ApprovalRate(), 0.0);
  EXPECT_EQ(m.FormattedAverageReviewTime(), "N/A");
  EXPECT_NE(m.Report(0).find("Average Review Time: N/A"), std::string::npos);
}

TEST(StagingMetricsTest, FormatsDurations) {
  EXPECT_EQ(StagingMetrics::FormatDuration(0), "N/A");
  EXPECT_EQ(StagingMetrics::FormatDuration(42'000), "42s");
  EXPECT_EQ(StagingMetrics::FormatDuration(185'000), "3m 5s");
  EXPECT_EQ(StagingMetrics::FormatDuration((2 * 60 + 10) * 60'000LL), "2h 10m");
}

TEST(StagingMetricsTest, ReportsIncludeExpiredTotal) {
  StagingMetrics m;
  m.OnRejected(Event(LifecycleEventKind::kRejected, 1000));
  EXPECT_NE(m.Report(4).find("Expired: 4"), std::string::npos);
  EXPECT_NE(m.Report(4).find("Rejection Rate: 100.0%"), std::string::npos);

  const std::string prom = m.PrometheusText(4);
  EXPECT_NE(prom.find("# TYPE stagegate_requests_rejected_total counter"), std::string::npos);
  EXPECT_NE(prom.find("stagegate_requests_expired_total 4\n"), std::string::npos);
  EXPECT_NE(prom.find("stagegate_review_time_ms_avg 1000\n"), std::string::npos);
}

// -----------------------------------------------------------------------------
// Event bus delivery
// -----------------------------------------------------------------------------
class ThrowingListener : public events::ILifecycleListener {
 public:
  void OnStaged(const LifecycleEvent& /*event*/) override {
    throw std::runtime_error("listener bug");
  }
};

TEST(EventBusTest, FailingListenerDoesNotStarveOthers) {
  events::EventBus bus;
  auto bad = std::make_shared<ThrowingListener>();
  auto metrics = std::make_shared<StagingMetrics>();
  bus.Subscribe(bad);
  bus.Subscribe(metrics);
  EXPECT_EQ(bus.SubscriberCount(), 2u);

  EXPECT_NO_THROW(bus.Publish(Event(LifecycleEventKind::kStaged, 0)));
  EXPECT_EQ(metrics->Get().staged, 1u);

  EXPECT_TRUE(bus.Unsubscribe(metrics));
  EXPECT_FALSE(bus.Unsubscribe(metrics));
  bus.Publish(Event(LifecycleEventKind::kStaged, 0));
  EXPECT_EQ(metrics->Get().staged, 1u);
}

}  // namespace
}  // namespace stagegate::telemetry
