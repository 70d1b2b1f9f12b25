// Repository: Stagegate
// Component: Lifecycle Engine
// Copyright (c) 2026 Stagegate

#include "stagegate/staging/LifecycleEngine.hpp"

#include <sstream>

#include "stagegate/staging/CommandValidator.hpp"
#include "stagegate/util/Logger.hpp"

namespace stagegate::staging {

namespace {

constexpr char kMsgQueued[] = "command queued for review";
constexpr char kMsgAutoApproved[] = "command auto-approved and executed";
constexpr char kMsgEmpty[] = "command is empty";
constexpr char kMsgSyntax[] = "command must start with '/' followed by an operation";

std::string ActorName(const std::optional<Principal>& reviewer) {
  return reviewer ? reviewer->name : std::string("System");
}

std::string OrderingKey(const std::string& request_id) {
  return "pending:" + request_id;
}

}  // namespace

const char* StageOutcomeName(StageOutcome outcome) {
  switch (outcome) {
    case StageOutcome::kQueued:         return "QUEUED";
    case StageOutcome::kAutoApproved:   return "AUTO_APPROVED";
    case StageOutcome::kRejectedEmpty:  return "REJECTED_EMPTY";
    case StageOutcome::kRejectedSyntax: return "REJECTED_SYNTAX";
  }
  return "UNKNOWN";
}

LifecycleEngine::LifecycleEngine(rules::RuleEvaluator rules,
                                 std::shared_ptr<store::IStagedRequestStore> store,
                                 std::shared_ptr<HistoryRecorder> history,
                                 std::shared_ptr<execution::ICommandDispatcher> dispatcher,
                                 std::shared_ptr<events::EventBus> events,
                                 std::shared_ptr<runtime::StorageExecutor> executor,
                                 std::shared_ptr<const time::ITimeSource> clock)
    : rules_(std::move(rules)),
      store_(std::move(store)),
      history_(std::move(history)),
      dispatcher_(std::move(dispatcher)),
      events_(std::move(events)),
      executor_(std::move(executor)),
      clock_(std::move(clock)),
      pending_(std::make_shared<PendingQueue>()) {}

StageResult LifecycleEngine::Stage(const Principal& requester,
                                   const std::string& command_text,
                                   bool allow_auto_approve) {
  StageResult result;
  switch (ValidateCommand(command_text)) {
    case ValidationResult::kEmpty:
      result.outcome = StageOutcome::kRejectedEmpty;
      result.message = kMsgEmpty;
      return result;
    case ValidationResult::kInvalidSyntax:
      result.outcome = StageOutcome::kRejectedSyntax;
      result.message = kMsgSyntax;
      return result;
    case ValidationResult::kValid:
      break;
  }

  StagedRequest request = StagedRequest::Create(requester, command_text, clock_->NowUtcMs());

  if (allow_auto_approve && rules_.ShouldAutoApprove(clock_->LocalTimeOfDayMs())) {
    request.status = RequestStatus::kApproved;
    Execute(request);
    {
      std::ostringstream oss;
      oss << "[LifecycleEngine] AUTO_APPROVED request_id=" << request.id
          << " requester=" << requester.name << " command=" << command_text;
      util::Logger::Info(oss.str());
    }
    events::LifecycleEvent event;
    event.kind = events::LifecycleEventKind::kApproved;
    event.request = request;
    event.system_actor = true;
    event.auto_approved = true;
    events_->Publish(event);

    result.outcome = StageOutcome::kAutoApproved;
    result.message = kMsgAutoApproved;
    result.request = std::move(request);
    return result;
  }

  // Save and Staged precede visibility, so a decision on this id cannot
  // queue its delete or publish its event ahead of them.
  PersistAsync(request);
  {
    std::ostringstream oss;
    oss << "[LifecycleEngine] STAGED request_id=" << request.id
        << " requester=" << requester.name << " command=" << command_text;
    util::Logger::Info(oss.str());
  }

  events::LifecycleEvent event;
  event.kind = events::LifecycleEventKind::kStaged;
  event.request = request;
  events_->Publish(event);
  pending_->Add(request);

  result.outcome = StageOutcome::kQueued;
  result.message = kMsgQueued;
  result.request = std::move(request);
  return result;
}

bool LifecycleEngine::Approve(const std::string& request_id,
                              const std::optional<Principal>& reviewer,
                              const std::optional<std::string>& justification) {
  return Decide(request_id, RequestStatus::kApproved, reviewer, justification);
}

bool LifecycleEngine::Reject(const std::string& request_id,
                             const std::optional<Principal>& reviewer,
                             const std::optional<std::string>& justification) {
  return Decide(request_id, RequestStatus::kRejected, reviewer, justification);
}

bool LifecycleEngine::Decide(const std::string& request_id, RequestStatus status,
                             const std::optional<Principal>& reviewer,
                             const std::optional<std::string>& justification) {
  std::optional<StagedRequest> taken = pending_->Take(request_id);
  if (!taken) {
    std::ostringstream oss;
    oss << "[LifecycleEngine] DECISION_IGNORED request_id=" << request_id
        << " status=" << RequestStatusName(status) << " reason=not_pending";
    util::Logger::Debug(oss.str());
    return false;
  }

  StagedRequest request = std::move(*taken);
  request.status = status;
  request.reviewer = reviewer;
  request.justification = justification;

  if (status == RequestStatus::kApproved) Execute(request);

  history_->Record(request);
  DeleteAsync(request.id);

  const int64_t elapsed = clock_->NowUtcMs() - request.timestamp_ms;
  {
    std::ostringstream oss;
    oss << "[LifecycleEngine] " << RequestStatusName(status) << " request_id=" << request.id
        << " reviewer=" << ActorName(reviewer) << " review_ms=" << elapsed
        << " command=" << request.command_text;
    util::Logger::Info(oss.str());
  }

  events::LifecycleEvent event;
  event.kind = status == RequestStatus::kApproved ? events::LifecycleEventKind::kApproved
                                                  : events::LifecycleEventKind::kRejected;
  event.request = request;
  event.review_elapsed_ms = elapsed;
  event.system_actor = !reviewer.has_value();
  events_->Publish(event);
  return true;
}

size_t LifecycleEngine::PruneExpired() {
  const int64_t now = clock_->NowUtcMs();
  std::vector<StagedRequest> expired = pending_->TakeIf(
      [this, now](const StagedRequest& r) { return rules_.IsExpired(r, now); });
  if (expired.empty()) return 0;

  std::vector<std::string> ids;
  std::vector<std::string> keys;
  ids.reserve(expired.size());
  keys.reserve(expired.size());
  for (const auto& r : expired) {
    ids.push_back(r.id);
    keys.push_back(OrderingKey(r.id));
    std::ostringstream oss;
    oss << "[LifecycleEngine] EXPIRED request_id=" << r.id << " requester=" << r.requester.name
        << " age_ms=" << (now - r.timestamp_ms) << " command=" << r.command_text;
    util::Logger::Info(oss.str());
  }

  auto store = store_;
  executor_->SubmitOrdered("pending.deleteAll", std::move(keys),
                           [store, ids]() { store->DeleteAll(ids); });
  expired_total_.fetch_add(expired.size());
  return expired.size();
}

std::vector<StagedRequest> LifecycleEngine::ListPending() {
  PruneExpired();
  return pending_->Snapshot();
}

std::optional<StagedRequest> LifecycleEngine::FindPending(const std::string& request_id) const {
  return pending_->Find(request_id);
}

size_t LifecycleEngine::PendingCount() const {
  return pending_->Size();
}

void LifecycleEngine::LoadOnStartup() {
  pending_->BeginLoad();
  auto store = store_;
  auto pending = pending_;
  executor_->Submit("pending.loadAll", [store, pending]() {
    std::vector<StagedRequest> loaded = store->LoadAll();
    std::vector<StagedRequest> usable;
    usable.reserve(loaded.size());
    for (auto& r : loaded) {
      if (r.status != RequestStatus::kPending) {
        std::ostringstream oss;
        oss << "[LifecycleEngine] LOAD_SKIP_DECIDED request_id=" << r.id
            << " status=" << RequestStatusName(r.status);
        util::Logger::Warn(oss.str());
        continue;
      }
      usable.push_back(std::move(r));
    }
    const size_t count = usable.size();
    const size_t carried = pending->ReplaceWithLoaded(std::move(usable));
    std::ostringstream oss;
    oss << "[LifecycleEngine] LOADED pending=" << count << " staged_during_load=" << carried;
    util::Logger::Info(oss.str());
  });
}

void LifecycleEngine::Execute(const StagedRequest& request) {
  const std::string text = StripOperationMarker(request.command_text);
  try {
    if (dispatcher_->IsActive(request.requester)) {
      dispatcher_->Dispatch(request.requester, text);
      std::ostringstream oss;
      oss << "[LifecycleEngine] EXECUTED request_id=" << request.id
          << " as=" << request.requester.name << " command=" << request.command_text;
      util::Logger::Info(oss.str());
    } else {
      std::ostringstream oss;
      oss << "[LifecycleEngine] EXECUTING_AS_CONSOLE request_id=" << request.id
          << " requester=" << request.requester.name << " reason=inactive"
          << " command=" << request.command_text;
      util::Logger::Warn(oss.str());
      dispatcher_->Dispatch(ConsolePrincipal(), text);
    }
  } catch (const std::exception& e) {
    std::ostringstream oss;
    oss << "[LifecycleEngine] DISPATCH_FAILED request_id=" << request.id
        << " error=" << e.what();
    util::Logger::Error(oss.str());
  }
}

void LifecycleEngine::PersistAsync(const StagedRequest& request) {
  auto store = store_;
  executor_->SubmitOrdered("pending.save", {OrderingKey(request.id)},
                           [store, request]() { store->Save(request); });
}

void LifecycleEngine::DeleteAsync(const std::string& request_id) {
  auto store = store_;
  executor_->SubmitOrdered("pending.delete", {OrderingKey(request_id)},
                           [store, request_id]() { store->Delete(request_id); });
}

}  // namespace stagegate::staging
