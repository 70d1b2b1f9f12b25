// Repository: Stagegate
// Component: Deterministic Wait Strategy (test only)
// Purpose: Records every backoff delay and advances DeterministicTimeSource by
//          exactly that amount. No sleep.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_
#define STAGEGATE_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_

#include "stagegate/time/IWaitStrategy.hpp"
#include "DeterministicTimeSource.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace stagegate::time {

class DeterministicWaitStrategy : public IWaitStrategy {
 public:
  explicit DeterministicWaitStrategy(std::shared_ptr<DeterministicTimeSource> ts = nullptr)
      : ts_(std::move(ts)) {}

  void WaitFor(std::chrono::milliseconds delay) override {
    std::lock_guard<std::mutex> lock(mutex_);
    delays_ms_.push_back(delay.count());
    if (ts_) ts_->AdvanceMs(delay.count());
  }

  std::vector<int64_t> Delays() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delays_ms_;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    delays_ms_.clear();
  }

 private:
  std::shared_ptr<DeterministicTimeSource> ts_;
  mutable std::mutex mutex_;
  std::vector<int64_t> delays_ms_;
};

}  // namespace stagegate::time

#endif  // STAGEGATE_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_
