// Repository: Stagegate
// Component: Resilient Store
// Purpose: Bounded retry with exponential backoff and a circuit breaker in
//          front of any IStagedRequestStore.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_RESILIENT_STORE_HPP_
#define STAGEGATE_STORE_RESILIENT_STORE_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "stagegate/store/IStagedRequestStore.hpp"
#include "stagegate/time/ITimeSource.hpp"
#include "stagegate/time/IWaitStrategy.hpp"

namespace stagegate::store {

struct RetryPolicy {
  int max_retries = 3;            // Additional attempts after the first.
  int64_t base_delay_ms = 100;
  int64_t max_delay_ms = 5000;
  int failure_threshold = 5;      // Exhausted operations before OPEN.
  int64_t cooldown_ms = 30000;    // OPEN -> HALF_OPEN.
  bool circuit_breaker_enabled = true;
};

enum class CircuitState {
  kClosed,    // failures < threshold
  kOpen,      // failures >= threshold, cooldown running
  kHalfOpen,  // failures >= threshold, cooldown elapsed; next call is a trial
};

const char* CircuitStateName(CircuitState state);

// Delegate contract is unchanged: callers see the same Save/Delete/LoadAll
// surface but never an exception. A failed attempt is retried up to
// max_retries times; an exhausted operation bumps the consecutive failure
// count, and reaching the threshold (re)opens the circuit with opened_at = now.
// While OPEN, mutations are dropped and LoadAll returns empty without touching
// the delegate. Any success resets the count and closes the circuit.
//
// Backoff waits block the calling thread; callers are storage workers.
class ResilientStore : public IStagedRequestStore {
 public:
  ResilientStore(std::shared_ptr<IStagedRequestStore> delegate,
                 RetryPolicy policy,
                 std::shared_ptr<const time::ITimeSource> clock,
                 std::shared_ptr<time::IWaitStrategy> waiter);

  ResilientStore(const ResilientStore&) = delete;
  ResilientStore& operator=(const ResilientStore&) = delete;

  void Save(const staging::StagedRequest& request) override;
  void Delete(const std::string& request_id) override;
  std::vector<staging::StagedRequest> LoadAll() override;
  void SaveAll(const std::vector<staging::StagedRequest>& requests) override;
  void DeleteAll(const std::vector<std::string>& request_ids) override;

  [[nodiscard]] int ConsecutiveFailures() const;
  [[nodiscard]] bool IsCircuitOpen() const;
  [[nodiscard]] CircuitState State() const;

  // Administrative: count = 0, circuit CLOSED.
  void ResetCircuitBreaker();

  // Multi-line human-readable retry configuration and circuit status.
  std::string StatusReport() const;

  const RetryPolicy& Policy() const { return policy_; }

  // min(base * 2^attempt, max); attempt is 0-indexed.
  static int64_t BackoffDelayMs(const RetryPolicy& policy, int attempt);

 private:
  // Returns true if fn eventually succeeded.
  template <typename Fn>
  bool ExecuteWithRetry(const char* operation, Fn&& fn);

  void RecordSuccess();
  void RecordFailure();

  std::shared_ptr<IStagedRequestStore> delegate_;
  const RetryPolicy policy_;
  std::shared_ptr<const time::ITimeSource> clock_;
  std::shared_ptr<time::IWaitStrategy> waiter_;

  std::atomic<int> consecutive_failures_{0};
  std::atomic<int64_t> opened_at_ms_{0};
  // Set while the single HALF_OPEN trial call is running.
  std::atomic<bool> trial_in_flight_{false};
};

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_RESILIENT_STORE_HPP_
