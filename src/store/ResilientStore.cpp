// Repository: Stagegate
// Component: Resilient Store
// Copyright (c) 2026 Stagegate

#include "stagegate/store/ResilientStore.hpp"

#include <algorithm>
#include <sstream>

#include "stagegate/util/Logger.hpp"

namespace stagegate::store {

using staging::StagedRequest;

const char* CircuitStateName(CircuitState state) {
  switch (state) {
    case CircuitState::kClosed:   return "CLOSED";
    case CircuitState::kOpen:     return "OPEN";
    case CircuitState::kHalfOpen: return "HALF_OPEN";
  }
  return "CLOSED";
}

ResilientStore::ResilientStore(std::shared_ptr<IStagedRequestStore> delegate,
                               RetryPolicy policy,
                               std::shared_ptr<const time::ITimeSource> clock,
                               std::shared_ptr<time::IWaitStrategy> waiter)
    : delegate_(std::move(delegate)),
      policy_(policy),
      clock_(std::move(clock)),
      waiter_(std::move(waiter)) {}

int64_t ResilientStore::BackoffDelayMs(const RetryPolicy& policy, int attempt) {
  // Past 2^62 the product overflows; the cap is reached long before that.
  if (attempt >= 62) return policy.max_delay_ms;
  const int64_t factor = int64_t{1} << attempt;
  if (policy.base_delay_ms > 0 && factor > policy.max_delay_ms / policy.base_delay_ms)
    return policy.max_delay_ms;
  return std::min(policy.base_delay_ms * factor, policy.max_delay_ms);
}

CircuitState ResilientStore::State() const {
  if (!policy_.circuit_breaker_enabled) return CircuitState::kClosed;
  if (consecutive_failures_.load() < policy_.failure_threshold) return CircuitState::kClosed;
  const int64_t elapsed = clock_->NowUtcMs() - opened_at_ms_.load();
  return elapsed < policy_.cooldown_ms ? CircuitState::kOpen : CircuitState::kHalfOpen;
}

int ResilientStore::ConsecutiveFailures() const {
  return consecutive_failures_.load();
}

bool ResilientStore::IsCircuitOpen() const {
  return State() == CircuitState::kOpen;
}

void ResilientStore::ResetCircuitBreaker() {
  consecutive_failures_.store(0);
  opened_at_ms_.store(0);
  util::Logger::Info("[ResilientStore] CIRCUIT_RESET manual=true");
}

void ResilientStore::RecordSuccess() {
  const int previous = consecutive_failures_.exchange(0);
  if (policy_.circuit_breaker_enabled && previous >= policy_.failure_threshold) {
    opened_at_ms_.store(0);
    util::Logger::Info("[ResilientStore] CIRCUIT_CLOSED after successful operation");
  }
}

void ResilientStore::RecordFailure() {
  const int failures = consecutive_failures_.fetch_add(1) + 1;
  if (!policy_.circuit_breaker_enabled || failures < policy_.failure_threshold) return;
  opened_at_ms_.store(clock_->NowUtcMs());
  std::ostringstream oss;
  oss << "[ResilientStore] CIRCUIT_OPENED failures=" << failures
      << " threshold=" << policy_.failure_threshold
      << " cooldown_ms=" << policy_.cooldown_ms;
  util::Logger::Warn(oss.str());
}

template <typename Fn>
bool ResilientStore::ExecuteWithRetry(const char* operation, Fn&& fn) {
  const CircuitState state = State();
  if (state == CircuitState::kOpen) {
    std::ostringstream oss;
    oss << "[ResilientStore] CIRCUIT_OPEN_REJECT op=" << operation;
    util::Logger::Warn(oss.str());
    return false;
  }
  bool trial = false;
  if (state == CircuitState::kHalfOpen) {
    bool expected = false;
    if (!trial_in_flight_.compare_exchange_strong(expected, true)) {
      std::ostringstream oss;
      oss << "[ResilientStore] CIRCUIT_HALF_OPEN_REJECT op=" << operation
          << " reason=trial_in_flight";
      util::Logger::Warn(oss.str());
      return false;
    }
    trial = true;
    std::ostringstream oss;
    oss << "[ResilientStore] CIRCUIT_HALF_OPEN trial op=" << operation;
    util::Logger::Info(oss.str());
  }
  struct TrialGuard {
    std::atomic<bool>* flag;
    ~TrialGuard() {
      if (flag) flag->store(false);
    }
  } trial_guard{trial ? &trial_in_flight_ : nullptr};

  const int total_attempts = policy_.max_retries + 1;
  for (int attempt = 0; attempt < total_attempts; ++attempt) {
    try {
      fn();
      RecordSuccess();
      return true;
    } catch (const std::exception& e) {
      if (attempt + 1 < total_attempts) {
        const int64_t delay = BackoffDelayMs(policy_, attempt);
        std::ostringstream oss;
        oss << "[ResilientStore] ATTEMPT_FAILED op=" << operation
            << " attempt=" << (attempt + 1) << "/" << total_attempts
            << " retry_in_ms=" << delay << " error=" << e.what();
        util::Logger::Warn(oss.str());
        waiter_->WaitFor(std::chrono::milliseconds(delay));
      } else {
        std::ostringstream oss;
        oss << "[ResilientStore] RETRIES_EXHAUSTED op=" << operation
            << " attempts=" << total_attempts << " error=" << e.what();
        util::Logger::Error(oss.str());
      }
    }
  }
  RecordFailure();
  return false;
}

void ResilientStore::Save(const StagedRequest& request) {
  ExecuteWithRetry("save", [&] { delegate_->Save(request); });
}

void ResilientStore::Delete(const std::string& request_id) {
  ExecuteWithRetry("delete", [&] { delegate_->Delete(request_id); });
}

std::vector<StagedRequest> ResilientStore::LoadAll() {
  std::vector<StagedRequest> result;
  if (!ExecuteWithRetry("loadAll", [&] { result = delegate_->LoadAll(); }))
    return {};
  return result;
}

void ResilientStore::SaveAll(const std::vector<StagedRequest>& requests) {
  ExecuteWithRetry("saveAll", [&] { delegate_->SaveAll(requests); });
}

void ResilientStore::DeleteAll(const std::vector<std::string>& request_ids) {
  ExecuteWithRetry("deleteAll", [&] { delegate_->DeleteAll(request_ids); });
}

std::string ResilientStore::StatusReport() const {
  const CircuitState state = State();
  std::ostringstream o;
  o << "Retry Configuration:\n"
    << "  Max Retries: " << policy_.max_retries << "\n"
    << "  Base Delay: " << policy_.base_delay_ms << "ms\n"
    << "  Max Delay: " << policy_.max_delay_ms << "ms\n"
    << "\nCircuit Breaker Status:\n"
    << "  Enabled: " << (policy_.circuit_breaker_enabled ? "yes" : "no") << "\n"
    << "  State: " << CircuitStateName(state) << "\n"
    << "  Consecutive Failures: " << consecutive_failures_.load() << "/"
    << policy_.failure_threshold << "\n";
  if (state == CircuitState::kOpen || state == CircuitState::kHalfOpen) {
    o << "  Time Since Opened: " << (clock_->NowUtcMs() - opened_at_ms_.load()) << "ms\n"
      << "  Cooldown Period: " << policy_.cooldown_ms << "ms\n";
  }
  return o.str();
}

}  // namespace stagegate::store
