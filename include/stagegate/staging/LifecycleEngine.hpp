// Repository: Stagegate
// Component: Lifecycle Engine
// Purpose: Owns the pending queue and drives every request from staging to
//          its single terminal disposition (approved, rejected or expired).
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STAGING_LIFECYCLE_ENGINE_HPP_
#define STAGEGATE_STAGING_LIFECYCLE_ENGINE_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stagegate/events/EventBus.hpp"
#include "stagegate/execution/ICommandDispatcher.hpp"
#include "stagegate/rules/RuleEvaluator.hpp"
#include "stagegate/runtime/StorageExecutor.hpp"
#include "stagegate/staging/HistoryRecorder.hpp"
#include "stagegate/staging/PendingQueue.hpp"
#include "stagegate/staging/StagedRequest.hpp"
#include "stagegate/store/IStagedRequestStore.hpp"
#include "stagegate/time/ITimeSource.hpp"

namespace stagegate::staging {

enum class StageOutcome {
  kQueued,
  kAutoApproved,
  kRejectedEmpty,
  kRejectedSyntax,
};

const char* StageOutcomeName(StageOutcome outcome);

struct StageResult {
  StageOutcome outcome = StageOutcome::kQueued;
  std::string message;
  // Set for kQueued and kAutoApproved.
  std::optional<StagedRequest> request;

  bool accepted() const {
    return outcome == StageOutcome::kQueued || outcome == StageOutcome::kAutoApproved;
  }
};

// Collaborators are injected as shared_ptrs. Async storage tasks hold their
// own references, so the engine may be destroyed while tasks are still queued
// on the executor.
//
// Thread model: Stage/Approve/Reject/PruneExpired/ListPending may be called
// from any thread. Durable I/O always runs on the storage executor.
class LifecycleEngine {
 public:
  LifecycleEngine(rules::RuleEvaluator rules,
                  std::shared_ptr<store::IStagedRequestStore> store,
                  std::shared_ptr<HistoryRecorder> history,
                  std::shared_ptr<execution::ICommandDispatcher> dispatcher,
                  std::shared_ptr<events::EventBus> events,
                  std::shared_ptr<runtime::StorageExecutor> executor,
                  std::shared_ptr<const time::ITimeSource> clock);

  LifecycleEngine(const LifecycleEngine&) = delete;
  LifecycleEngine& operator=(const LifecycleEngine&) = delete;

  // Validation runs first; an invalid command never reaches the rules. With
  // allow_auto_approve and an in-window local time the command is dispatched
  // immediately and never becomes pending.
  StageResult Stage(const Principal& requester, const std::string& command_text,
                    bool allow_auto_approve = true);

  // Returns false if request_id is not pending (already decided, expired, or
  // unknown). A null reviewer records a system decision.
  bool Approve(const std::string& request_id,
               const std::optional<Principal>& reviewer,
               const std::optional<std::string>& justification = std::nullopt);
  bool Reject(const std::string& request_id,
              const std::optional<Principal>& reviewer,
              const std::optional<std::string>& justification = std::nullopt);

  // Removes every expired request and deletes them from the store in one
  // batch. Returns how many were removed. Idempotent.
  size_t PruneExpired();

  // Prunes, then returns a snapshot in staging order.
  std::vector<StagedRequest> ListPending();
  std::optional<StagedRequest> FindPending(const std::string& request_id) const;
  size_t PendingCount() const;

  // Asynchronously replaces the pending contents with the durable ones.
  // Reads before completion see whatever was staged since startup.
  void LoadOnStartup();

  uint64_t ExpiredTotal() const { return expired_total_.load(); }

  const rules::RuleEvaluator& Rules() const { return rules_; }
  HistoryRecorder& History() { return *history_; }

 private:
  // Dispatches as the requester when active, else as the console principal.
  void Execute(const StagedRequest& request);
  void PersistAsync(const StagedRequest& request);
  void DeleteAsync(const std::string& request_id);
  bool Decide(const std::string& request_id, RequestStatus status,
              const std::optional<Principal>& reviewer,
              const std::optional<std::string>& justification);

  const rules::RuleEvaluator rules_;
  std::shared_ptr<store::IStagedRequestStore> store_;
  std::shared_ptr<HistoryRecorder> history_;
  std::shared_ptr<execution::ICommandDispatcher> dispatcher_;
  std::shared_ptr<events::EventBus> events_;
  std::shared_ptr<runtime::StorageExecutor> executor_;
  std::shared_ptr<const time::ITimeSource> clock_;

  std::shared_ptr<PendingQueue> pending_;
  std::atomic<uint64_t> expired_total_{0};
};

}  // namespace stagegate::staging

#endif  // STAGEGATE_STAGING_LIFECYCLE_ENGINE_HPP_
