// Repository: Stagegate
// Component: History Recorder contract tests
// Purpose: Per-requester cap with oldest-timestamp eviction, newest-first
//          reads, and merge of persisted history at startup.
// Copyright (c) 2026 Stagegate

#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <string>

#include "fixtures/FlakyStore.h"
#include "stagegate/staging/HistoryRecorder.hpp"

namespace stagegate::staging {
namespace {

using tests::fixtures::MemoryHistoryStore;

StagedRequest Decided(const std::string& requester_id, const std::string& text, int64_t ts,
                      RequestStatus status = RequestStatus::kApproved) {
  StagedRequest r = StagedRequest::Create(Principal{requester_id, requester_id}, text, ts);
  r.status = status;
  return r;
}

class HistoryRecorderContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<MemoryHistoryStore>();
    executor_ = std::make_shared<runtime::StorageExecutor>();
  }

  std::shared_ptr<MemoryHistoryStore> store_;
  std::shared_ptr<runtime::StorageExecutor> executor_;
};

TEST_F(HistoryRecorderContractTest, ReadsAreNewestFirst) {
  HistoryRecorder history(store_, executor_);
  history.Record(Decided("u-1", "/a", 100));
  history.Record(Decided("u-1", "/c", 300));
  history.Record(Decided("u-1", "/b", 200));

  auto list = history.HistoryFor("u-1");
  ASSERT_EQ(list.size(), 3u);
  EXPECT_EQ(list[0].command_text, "/c");
  EXPECT_EQ(list[1].command_text, "/b");
  EXPECT_EQ(list[2].command_text, "/a");

  auto recent = history.RecentHistoryFor("u-1", 2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].command_text, "/c");
  EXPECT_TRUE(history.HistoryFor("u-unknown").empty());
}

TEST_F(HistoryRecorderContractTest, CapEvictsLowestTimestamp) {
  HistoryRecorder history(store_, executor_, 3);
  history.Record(Decided("u-1", "/t2", 200));
  history.Record(Decided("u-1", "/t1", 100));
  history.Record(Decided("u-1", "/t3", 300));
  history.Record(Decided("u-1", "/t4", 400));

  auto list = history.HistoryFor("u-1");
  ASSERT_EQ(list.size(), 3u);
  for (const auto& r : list) EXPECT_NE(r.command_text, "/t1");
}

TEST_F(HistoryRecorderContractTest, DefaultCapHoldsFiftyAndFiftyFirstEvictsOldest) {
  HistoryRecorder history(store_, executor_);
  // Timestamps 1000..1049 recorded out of order; the oldest is 1000.
  for (int i = 49; i >= 0; --i) {
    history.Record(Decided("u-1", "/cmd" + std::to_string(i), 1000 + i));
  }
  ASSERT_EQ(history.HistoryFor("u-1").size(), HistoryRecorder::kDefaultMaxPerRequester);
  EXPECT_EQ(history.HistoryFor("u-1").back().timestamp_ms, 1000);

  history.Record(Decided("u-1", "/cmd50", 1050));
  auto list = history.HistoryFor("u-1");
  ASSERT_EQ(list.size(), 50u);
  EXPECT_EQ(list.front().command_text, "/cmd50");
  EXPECT_EQ(list.back().timestamp_ms, 1001);
  for (const auto& r : list) EXPECT_NE(r.command_text, "/cmd0");

  executor_->WaitIdle();
  EXPECT_EQ(store_->Load("u-1").size(), 50u);
}

TEST_F(HistoryRecorderContractTest, RequestersAreIndependent) {
  HistoryRecorder history(store_, executor_, 1);
  history.Record(Decided("u-1", "/x", 100));
  history.Record(Decided("u-2", "/y", 50));
  EXPECT_EQ(history.RequesterCount(), 2u);
  EXPECT_EQ(history.HistoryFor("u-1").size(), 1u);
  EXPECT_EQ(history.HistoryFor("u-2").size(), 1u);
}

TEST_F(HistoryRecorderContractTest, EveryRecordPersistsTheRequesterList) {
  HistoryRecorder history(store_, executor_, 2);
  history.Record(Decided("u-1", "/a", 100));
  history.Record(Decided("u-1", "/b", 200));
  history.Record(Decided("u-1", "/c", 300));
  executor_->WaitIdle();

  EXPECT_EQ(store_->Saves(), 3);
  auto persisted = store_->Load("u-1");
  ASSERT_EQ(persisted.size(), 2u);
  for (const auto& r : persisted) EXPECT_NE(r.command_text, "/a");
}

TEST_F(HistoryRecorderContractTest, LoadMergesPersistedWithRecordedSinceStartup) {
  StagedRequest persisted_a = Decided("u-1", "/persisted-a", 100);
  StagedRequest persisted_b = Decided("u-1", "/persisted-b", 200, RequestStatus::kRejected);
  store_->Save("u-1", {persisted_a, persisted_b});
  store_->Save("u-2", {Decided("u-2", "/other", 150)});

  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  executor_->Submit("test.block", [gate]() { gate.wait(); });

  HistoryRecorder history(store_, executor_, 10);
  history.LoadAsync();
  history.Record(persisted_b);  // Same id recorded again before the load lands.
  history.Record(Decided("u-1", "/live", 300));
  release.set_value();
  executor_->WaitIdle();

  auto list = history.HistoryFor("u-1");
  ASSERT_EQ(list.size(), 3u);
  EXPECT_EQ(list[0].command_text, "/live");
  EXPECT_EQ(list[1].command_text, "/persisted-b");
  EXPECT_EQ(list[2].command_text, "/persisted-a");
  EXPECT_EQ(history.HistoryFor("u-2").size(), 1u);
}

TEST_F(HistoryRecorderContractTest, LoadAppliesCap) {
  std::vector<StagedRequest> many;
  for (int i = 0; i < 5; ++i) many.push_back(Decided("u-1", "/n" + std::to_string(i), 100 + i));
  store_->Save("u-1", many);

  HistoryRecorder history(store_, executor_, 2);
  history.LoadAsync();
  executor_->WaitIdle();

  auto list = history.HistoryFor("u-1");
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].command_text, "/n4");
  EXPECT_EQ(list[1].command_text, "/n3");
}

}  // namespace
}  // namespace stagegate::staging
