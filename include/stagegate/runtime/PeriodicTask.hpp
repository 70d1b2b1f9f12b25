// Repository: Stagegate
// Component: Periodic Task
// Purpose: Dedicated thread that runs a callback every interval until stopped.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_RUNTIME_PERIODIC_TASK_HPP_
#define STAGEGATE_RUNTIME_PERIODIC_TASK_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace stagegate::runtime {

// The first run happens one interval after Start(). Stop() wakes the thread
// immediately and joins it; the destructor calls Stop(). A callback that
// throws is logged and the schedule continues.
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

  // Runs the callback once on the calling thread, with the same error handling.
  void RunOnce();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  uint64_t Runs() const { return runs_.load(std::memory_order_relaxed); }
  const std::string& Name() const { return name_; }

 private:
  void Loop();

  const std::string name_;
  const std::chrono::milliseconds interval_;
  std::function<void()> fn_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> runs_{0};
  std::thread thread_;
};

}  // namespace stagegate::runtime

#endif  // STAGEGATE_RUNTIME_PERIODIC_TASK_HPP_
