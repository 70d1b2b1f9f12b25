// Repository: Stagegate
// Component: Host dispatch channel unit tests
// Copyright (c) 2026 Stagegate

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "stagegate/execution/HostDispatchChannel.hpp"

namespace stagegate::execution {
namespace {

using std::chrono::milliseconds;
using staging::Principal;

TEST(HostDispatchChannelTest, ConsoleIsAlwaysActive) {
  HostDispatchChannel channel;
  EXPECT_TRUE(channel.IsActive(staging::ConsolePrincipal()));
}

TEST(HostDispatchChannelTest, PresenceTracksHostReports) {
  HostDispatchChannel channel;
  Principal alice{"u-1", "alice"};
  EXPECT_FALSE(channel.IsActive(alice));
  channel.SetPresence(alice.id, true);
  EXPECT_TRUE(channel.IsActive(alice));
  channel.SetPresence(alice.id, false);
  EXPECT_FALSE(channel.IsActive(alice));
}

TEST(HostDispatchChannelTest, DispatchFansOutToEverySubscriber) {
  HostDispatchChannel channel;
  auto a = channel.Subscribe();
  auto b = channel.Subscribe();
  channel.Dispatch(Principal{"u-1", "alice"}, "kick bob");

  auto ra = a->WaitNext(milliseconds(100));
  auto rb = b->WaitNext(milliseconds(100));
  ASSERT_TRUE(ra.has_value());
  ASSERT_TRUE(rb.has_value());
  EXPECT_EQ(ra->sequence, 1u);
  EXPECT_EQ(ra->actor.name, "alice");
  EXPECT_EQ(rb->command_text, "kick bob");
  EXPECT_EQ(channel.DispatchedTotal(), 1u);
}

TEST(HostDispatchChannelTest, UndeliveredRecordsGoToNextSubscriber) {
  HostDispatchChannel channel;
  channel.Dispatch(staging::ConsolePrincipal(), "first");
  channel.Dispatch(staging::ConsolePrincipal(), "second");

  auto sub = channel.Subscribe();
  EXPECT_EQ(sub->Backlog(), 2u);
  EXPECT_EQ(sub->WaitNext(milliseconds(10))->command_text, "first");
  EXPECT_EQ(sub->WaitNext(milliseconds(10))->command_text, "second");
  EXPECT_FALSE(sub->WaitNext(milliseconds(10)).has_value());
}

TEST(HostDispatchChannelTest, UndeliveredBufferIsBounded) {
  HostDispatchChannel channel;
  for (size_t i = 0; i < HostDispatchChannel::kMaxUndelivered + 5; ++i)
    channel.Dispatch(staging::ConsolePrincipal(), "cmd" + std::to_string(i));

  auto sub = channel.Subscribe();
  EXPECT_EQ(sub->Backlog(), HostDispatchChannel::kMaxUndelivered);
  EXPECT_EQ(sub->WaitNext(milliseconds(10))->command_text, "cmd5");
}

TEST(HostDispatchChannelTest, CloseWakesWaiterAndUnsubscribes) {
  HostDispatchChannel channel;
  auto sub = channel.Subscribe();
  std::thread closer([&] {
    std::this_thread::sleep_for(milliseconds(20));
    channel.Unsubscribe(sub);
  });
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(sub->WaitNext(milliseconds(5000)).has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(4000));
  closer.join();

  EXPECT_TRUE(sub->IsClosed());
  EXPECT_EQ(channel.SubscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// Reconnecting hosts
// -----------------------------------------------------------------------------

TEST(HostDispatchChannelTest, UnreadBacklogSurvivesHostReconnect) {
  HostDispatchChannel channel;
  auto first = channel.Subscribe();
  channel.Dispatch(staging::ConsolePrincipal(), "ban x");
  channel.Unsubscribe(first);

  auto second = channel.Subscribe();
  auto record = second->WaitNext(milliseconds(50));
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->command_text, "ban x");
  EXPECT_EQ(record->sequence, 1u);
}

TEST(HostDispatchChannelTest, RecordThatFailedToWriteIsRedeliveredFirst) {
  HostDispatchChannel channel;
  auto first = channel.Subscribe();
  channel.Dispatch(staging::ConsolePrincipal(), "one");
  channel.Dispatch(staging::ConsolePrincipal(), "two");

  auto taken = first->WaitNext(milliseconds(10));
  ASSERT_TRUE(taken.has_value());
  channel.Unsubscribe(first, taken);
  channel.Dispatch(staging::ConsolePrincipal(), "three");

  auto second = channel.Subscribe();
  EXPECT_EQ(second->Backlog(), 3u);
  EXPECT_EQ(second->WaitNext(milliseconds(10))->command_text, "one");
  EXPECT_EQ(second->WaitNext(milliseconds(10))->command_text, "two");
  EXPECT_EQ(second->WaitNext(milliseconds(10))->command_text, "three");
}

TEST(HostDispatchChannelTest, BacklogIsDroppedWhileAnotherHostHoldsIt) {
  HostDispatchChannel channel;
  auto a = channel.Subscribe();
  auto b = channel.Subscribe();
  channel.Dispatch(staging::ConsolePrincipal(), "kick bob");
  channel.Unsubscribe(a);

  EXPECT_EQ(b->WaitNext(milliseconds(10))->command_text, "kick bob");
  channel.Unsubscribe(b);
  auto c = channel.Subscribe();
  EXPECT_EQ(c->Backlog(), 0u);
}

TEST(HostDispatchChannelTest, ConcurrentDispatchesArriveInSequenceOrder) {
  HostDispatchChannel channel;
  auto sub = channel.Subscribe();
  constexpr int kPerThread = 200;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&channel, t] {
      for (int i = 0; i < kPerThread; ++i)
        channel.Dispatch(staging::ConsolePrincipal(), "t" + std::to_string(t));
    });
  }
  for (auto& t : threads) t.join();

  uint64_t last = 0;
  for (int i = 0; i < 4 * kPerThread; ++i) {
    auto record = sub->WaitNext(milliseconds(100));
    ASSERT_TRUE(record.has_value());
    EXPECT_GT(record->sequence, last);
    last = record->sequence;
  }
}

}  // namespace
}  // namespace stagegate::execution
