// Repository: Stagegate
// Component: Storage executor unit tests
// Copyright (c) 2026 Stagegate

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <stdexcept>
#include <vector>

#include "stagegate/runtime/StorageExecutor.hpp"

namespace stagegate::runtime {
namespace {

TEST(StorageExecutorTest, SingleWorkerRunsTasksInSubmissionOrder) {
  StorageExecutor executor;
  EXPECT_EQ(executor.WorkerCount(), 1u);

  std::mutex mutex;
  std::vector<int> order;
  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(executor.Submit("order", [&, i] {
      std::lock_guard<std::mutex> lock(mutex);
      order.push_back(i);
    }));
  }
  executor.WaitIdle();

  ASSERT_EQ(order.size(), 100u);
  for (int i = 0; i < 100; ++i) EXPECT_EQ(order[i], i);
  EXPECT_EQ(executor.PendingTasks(), 0u);
}

TEST(StorageExecutorTest, ThrowingTaskIsCountedAndWorkerSurvives) {
  StorageExecutor executor;
  std::atomic<int> ran{0};
  executor.Submit("boom", [] { throw std::runtime_error("disk full"); });
  executor.Submit("after", [&] { ran.fetch_add(1); });
  executor.WaitIdle();

  EXPECT_EQ(executor.FailedTasks(), 1u);
  EXPECT_EQ(ran.load(), 1);
}

TEST(StorageExecutorTest, DestructorDrainsQueuedTasks) {
  std::atomic<int> ran{0};
  {
    StorageExecutor executor(2);
    EXPECT_EQ(executor.WorkerCount(), 2u);
    for (int i = 0; i < 50; ++i) executor.Submit("drain", [&] { ran.fetch_add(1); });
  }
  EXPECT_EQ(ran.load(), 50);
}

TEST(StorageExecutorTest, TasksSharingAKeyRunInOrderAcrossWorkers) {
  StorageExecutor executor(4);
  std::mutex mutex;
  std::vector<std::string> order;
  auto record = [&](const std::string& what) {
    std::lock_guard<std::mutex> lock(mutex);
    order.push_back(what);
  };

  executor.SubmitOrdered("save", {"pending:r1"}, [&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    record("save");
  });
  executor.SubmitOrdered("delete", {"pending:r1"}, [&] { record("delete"); });
  executor.WaitIdle();

  ASSERT_EQ(order.size(), 2u);
  EXPECT_EQ(order[0], "save");
  EXPECT_EQ(order[1], "delete");
}

TEST(StorageExecutorTest, MultiKeyTaskWaitsForEveryEarlierKeyHolder) {
  StorageExecutor executor(3);
  std::mutex mutex;
  std::vector<std::string> order;
  auto record = [&](const std::string& what) {
    std::lock_guard<std::mutex> lock(mutex);
    order.push_back(what);
  };

  executor.SubmitOrdered("save.a", {"a"}, [&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    record("save.a");
  });
  executor.SubmitOrdered("save.b", {"b"}, [&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    record("save.b");
  });
  executor.SubmitOrdered("deleteAll", {"a", "b"}, [&] { record("deleteAll"); });
  executor.WaitIdle();

  ASSERT_EQ(order.size(), 3u);
  EXPECT_EQ(order[2], "deleteAll");
}

TEST(StorageExecutorTest, DistinctKeysDoNotBlockEachOther) {
  StorageExecutor executor(2);
  std::promise<void> second_ran;
  std::shared_future<void> second = second_ran.get_future().share();
  std::atomic<bool> overlapped{false};

  executor.SubmitOrdered("first", {"a"}, [&overlapped, second] {
    overlapped.store(second.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  });
  executor.SubmitOrdered("second", {"b"}, [&second_ran] { second_ran.set_value(); });
  executor.WaitIdle();

  EXPECT_TRUE(overlapped.load());
}

}  // namespace
}  // namespace stagegate::runtime
