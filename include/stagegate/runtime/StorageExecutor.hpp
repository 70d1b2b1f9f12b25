// Repository: Stagegate
// Component: Storage Executor
// Purpose: Worker threads that run all durable I/O off the caller's thread.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_RUNTIME_STORAGE_EXECUTOR_HPP_
#define STAGEGATE_RUNTIME_STORAGE_EXECUTOR_HPP_

#include <condition_variable>
#include <cstdint>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace stagegate::runtime {

// FIFO task queue drained by worker_count threads. With one worker (the
// default) tasks run strictly in submission order. With more workers,
// unkeyed tasks may run concurrently and out of order; tasks that share an
// ordering key never overlap and run in submission order, so a save
// submitted before a delete for the same request always lands first.
//
// A task that throws is logged at error level; the worker keeps running.
// The destructor drains the queue, then joins.
class StorageExecutor {
 public:
  static constexpr size_t kDefaultWorkers = 1;

  explicit StorageExecutor(size_t worker_count = kDefaultWorkers);
  ~StorageExecutor();

  StorageExecutor(const StorageExecutor&) = delete;
  StorageExecutor& operator=(const StorageExecutor&) = delete;

  // label appears in the failure log line. Returns false (task dropped) once
  // shutdown has begun.
  bool Submit(std::string label, std::function<void()> task);

  // As Submit, but the task is not started while an earlier task sharing any
  // of keys is queued or running.
  bool SubmitOrdered(std::string label, std::vector<std::string> keys,
                     std::function<void()> task);

  // Blocks until the queue is empty and no task is running.
  void WaitIdle();

  size_t PendingTasks() const;
  size_t WorkerCount() const { return workers_.size(); }
  uint64_t FailedTasks() const;

 private:
  struct Task {
    std::string label;
    std::vector<std::string> keys;
    std::function<void()> fn;
  };

  void WorkerLoop(size_t index);
  std::deque<Task>::iterator FindRunnableLocked();

  mutable std::mutex mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<Task> queue_;
  std::multiset<std::string> busy_keys_;
  size_t running_ = 0;
  uint64_t failed_ = 0;
  bool shutdown_ = false;
  std::vector<std::thread> workers_;
};

}  // namespace stagegate::runtime

#endif  // STAGEGATE_RUNTIME_STORAGE_EXECUTOR_HPP_
