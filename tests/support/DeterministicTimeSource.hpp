#pragma once
#include "stagegate/time/ITimeSource.hpp"

#include <atomic>
#include <cstdint>

// Virtual clock for tests. Wall time and local time-of-day are independent so
// a test can pin the auto-approve window without touching expiration math.
class DeterministicTimeSource : public stagegate::time::ITimeSource {
public:
  explicit DeterministicTimeSource(int64_t start_ms = 1'000'000'000LL,
                                   int64_t local_tod_ms = 12LL * 60 * 60 * 1000)
      : now_ms_(start_ms), local_tod_ms_(local_tod_ms) {}

  int64_t NowUtcMs() const override { return now_ms_.load(); }

  int64_t LocalTimeOfDayMs() const override { return local_tod_ms_.load(); }

  void AdvanceMs(int64_t delta) { now_ms_.fetch_add(delta); }

  void SetMs(int64_t value) { now_ms_.store(value); }

  void SetLocalTimeOfDayMs(int64_t value) { local_tod_ms_.store(value); }

private:
  std::atomic<int64_t> now_ms_;
  std::atomic<int64_t> local_tod_ms_;
};
