// Repository: Stagegate
// Component: Pending queue unit tests
// Copyright (c) 2026 Stagegate

#include <gtest/gtest.h>

#include "stagegate/staging/PendingQueue.hpp"

namespace stagegate::staging {
namespace {

StagedRequest Make(const std::string& text, int64_t ts) {
  return StagedRequest::Create(Principal{"u-1", "alice"}, text, ts);
}

TEST(PendingQueueTest, AddRejectsDuplicateIds) {
  PendingQueue q;
  StagedRequest r = Make("/a", 1);
  EXPECT_TRUE(q.Add(r));
  EXPECT_FALSE(q.Add(r));
  EXPECT_EQ(q.Size(), 1u);
  EXPECT_TRUE(q.Contains(r.id));
}

TEST(PendingQueueTest, TakeRemovesExactlyOnce) {
  PendingQueue q;
  StagedRequest r = Make("/a", 1);
  q.Add(r);
  auto taken = q.Take(r.id);
  ASSERT_TRUE(taken.has_value());
  EXPECT_EQ(taken->command_text, "/a");
  EXPECT_FALSE(q.Take(r.id).has_value());
  EXPECT_FALSE(q.Find(r.id).has_value());
}

TEST(PendingQueueTest, TakeIfKeepsOrderOfRemainder) {
  PendingQueue q;
  StagedRequest a = Make("/a", 1);
  StagedRequest b = Make("/b", 2);
  StagedRequest c = Make("/c", 3);
  q.Add(a);
  q.Add(b);
  q.Add(c);

  auto taken = q.TakeIf([](const StagedRequest& r) { return r.timestamp_ms != 2; });
  ASSERT_EQ(taken.size(), 2u);
  EXPECT_EQ(taken[0].id, a.id);
  EXPECT_EQ(taken[1].id, c.id);
  auto rest = q.Snapshot();
  ASSERT_EQ(rest.size(), 1u);
  EXPECT_EQ(rest[0].id, b.id);
}

// -----------------------------------------------------------------------------
// Startup load merge
// -----------------------------------------------------------------------------
TEST(PendingQueueTest, LoadReplacesContentsAndCarriesNewRequests) {
  PendingQueue q;
  StagedRequest durable = Make("/durable", 1);
  StagedRequest both = Make("/both", 2);
  StagedRequest fresh = Make("/fresh", 3);

  q.BeginLoad();
  q.Add(both);
  q.Add(fresh);
  const size_t carried = q.ReplaceWithLoaded({durable, both});

  EXPECT_EQ(carried, 1u);
  auto all = q.Snapshot();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].id, durable.id);
  EXPECT_EQ(all[1].id, both.id);
  EXPECT_EQ(all[2].id, fresh.id);
}

TEST(PendingQueueTest, LoadDoesNotReviveRemovedIds) {
  PendingQueue q;
  StagedRequest decided = Make("/decided", 1);
  StagedRequest expired = Make("/expired", 2);
  q.BeginLoad();
  q.Add(decided);
  q.Add(expired);
  q.Take(decided.id);
  q.TakeIf([&](const StagedRequest& r) { return r.id == expired.id; });

  q.ReplaceWithLoaded({decided, expired});
  EXPECT_EQ(q.Size(), 0u);

  // Removal tracking ends with the load.
  q.Add(decided);
  q.Take(decided.id);
  q.BeginLoad();
  q.ReplaceWithLoaded({decided});
  EXPECT_EQ(q.Size(), 1u);
}

}  // namespace
}  // namespace stagegate::staging
