// Repository: Stagegate
// Component: Periodic Task
// Copyright (c) 2026 Stagegate

#include "stagegate/runtime/PeriodicTask.hpp"

#include <sstream>

#include "stagegate/util/Logger.hpp"

namespace stagegate::runtime {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_.load(std::memory_order_acquire)) return;
  stop_requested_ = false;
  running_.store(true, std::memory_order_release);
  thread_ = std::thread([this] { Loop(); });

  std::ostringstream oss;
  oss << "[PeriodicTask] START name=" << name_ << " interval_ms=" << interval_.count();
  util::Logger::Info(oss.str());
}

void PeriodicTask::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
    cv_.notify_all();
  }
  if (thread_.joinable()) thread_.join();
  running_.store(false, std::memory_order_release);
}

void PeriodicTask::RunOnce() {
  try {
    fn_();
  } catch (const std::exception& e) {
    std::ostringstream oss;
    oss << "[PeriodicTask] RUN_FAILED name=" << name_ << " error=" << e.what();
    util::Logger::Error(oss.str());
  }
  runs_.fetch_add(1, std::memory_order_relaxed);
}

void PeriodicTask::Loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) break;
    }
    RunOnce();
  }
}

}  // namespace stagegate::runtime
