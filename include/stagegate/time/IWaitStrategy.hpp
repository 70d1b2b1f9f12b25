// Repository: Stagegate
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from retry backoff math in ResilientStore.
//          Production: RealtimeWaitStrategy sleeps for the delay.
//          Tests: RecordingWaitStrategy (records delays, advances virtual time).
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_TIME_IWAIT_STRATEGY_HPP_
#define STAGEGATE_TIME_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <thread>

namespace stagegate::time {

class IWaitStrategy {
 public:
  virtual void WaitFor(std::chrono::milliseconds delay) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  void WaitFor(std::chrono::milliseconds delay) override {
    std::this_thread::sleep_for(delay);
  }
};

}  // namespace stagegate::time

#endif  // STAGEGATE_TIME_IWAIT_STRATEGY_HPP_
