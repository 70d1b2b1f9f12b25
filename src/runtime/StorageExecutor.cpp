// Repository: Stagegate
// Component: Storage Executor
// Copyright (c) 2026 Stagegate

#include "stagegate/runtime/StorageExecutor.hpp"

#include <sstream>

#include "stagegate/util/Logger.hpp"

namespace stagegate::runtime {

StorageExecutor::StorageExecutor(size_t worker_count) {
  if (worker_count == 0) worker_count = 1;
  workers_.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers_.emplace_back(&StorageExecutor::WorkerLoop, this, i);
  }
}

StorageExecutor::~StorageExecutor() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
    queue_cv_.notify_all();
  }
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

bool StorageExecutor::Submit(std::string label, std::function<void()> task) {
  return SubmitOrdered(std::move(label), {}, std::move(task));
}

bool StorageExecutor::SubmitOrdered(std::string label, std::vector<std::string> keys,
                                    std::function<void()> task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_) {
    util::Logger::Warn("[StorageExecutor] SUBMIT_AFTER_SHUTDOWN task=" + label);
    return false;
  }
  queue_.push_back(Task{std::move(label), std::move(keys), std::move(task)});
  // A woken worker may find only blocked tasks; wake them all.
  queue_cv_.notify_all();
  return true;
}

// First queued task whose keys are neither running nor claimed by an earlier
// queued task.
std::deque<StorageExecutor::Task>::iterator StorageExecutor::FindRunnableLocked() {
  std::set<std::string> claimed;
  for (auto it = queue_.begin(); it != queue_.end(); ++it) {
    bool blocked = false;
    for (const auto& key : it->keys) {
      if (busy_keys_.count(key) > 0 || claimed.count(key) > 0) {
        blocked = true;
        break;
      }
    }
    if (!blocked) return it;
    claimed.insert(it->keys.begin(), it->keys.end());
  }
  return queue_.end();
}

void StorageExecutor::WaitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

size_t StorageExecutor::PendingTasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size() + running_;
}

uint64_t StorageExecutor::FailedTasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_;
}

void StorageExecutor::WorkerLoop(size_t index) {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      auto next = queue_.end();
      queue_cv_.wait(lock, [this, &next] {
        next = FindRunnableLocked();
        return next != queue_.end() || (shutdown_ && queue_.empty());
      });
      // Drain before exit.
      if (next == queue_.end()) break;
      task = std::move(*next);
      queue_.erase(next);
      busy_keys_.insert(task.keys.begin(), task.keys.end());
      ++running_;
    }

    bool failed = false;
    try {
      task.fn();
    } catch (const std::exception& e) {
      failed = true;
      std::ostringstream oss;
      oss << "[StorageExecutor] TASK_FAILED worker=" << index << " task=" << task.label
          << " error=" << e.what();
      util::Logger::Error(oss.str());
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --running_;
      if (failed) ++failed_;
      for (const auto& key : task.keys) busy_keys_.erase(busy_keys_.find(key));
      if (!task.keys.empty()) queue_cv_.notify_all();
      if (queue_.empty() && running_ == 0) idle_cv_.notify_all();
    }
  }
}

}  // namespace stagegate::runtime
