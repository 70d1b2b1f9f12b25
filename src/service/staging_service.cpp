// Repository: Stagegate
// Component: StagingControl gRPC Service Implementation
// Purpose: Thin adapter from stagegate.v1.StagingControl to LifecycleEngine.
// Copyright (c) 2026 Stagegate

#include "staging_service.h"

#include <sstream>
#include <string>
#include <utility>

#include "stagegate/util/Logger.hpp"

namespace stagegate
{
  namespace service
  {

    namespace
    {
      v1::RequestStatus ToProtoStatus(staging::RequestStatus status)
      {
        switch (status)
        {
        case staging::RequestStatus::kPending:
          return v1::REQUEST_STATUS_PENDING;
        case staging::RequestStatus::kApproved:
          return v1::REQUEST_STATUS_APPROVED;
        case staging::RequestStatus::kRejected:
          return v1::REQUEST_STATUS_REJECTED;
        }
        return v1::REQUEST_STATUS_PENDING;
      }

      v1::StageOutcome ToProtoOutcome(staging::StageOutcome outcome)
      {
        switch (outcome)
        {
        case staging::StageOutcome::kQueued:
          return v1::STAGE_OUTCOME_QUEUED;
        case staging::StageOutcome::kAutoApproved:
          return v1::STAGE_OUTCOME_AUTO_APPROVED;
        case staging::StageOutcome::kRejectedEmpty:
          return v1::STAGE_OUTCOME_REJECTED_EMPTY;
        case staging::StageOutcome::kRejectedSyntax:
          return v1::STAGE_OUTCOME_REJECTED_SYNTAX;
        }
        return v1::STAGE_OUTCOME_QUEUED;
      }
    } // namespace

    StagingControlImpl::StagingControlImpl(
        std::shared_ptr<staging::LifecycleEngine> engine,
        std::shared_ptr<store::ResilientStore> resilient_store,
        std::shared_ptr<telemetry::StagingMetrics> metrics,
        std::shared_ptr<execution::HostDispatchChannel> channel)
        : engine_(std::move(engine)),
          resilient_store_(std::move(resilient_store)),
          metrics_(std::move(metrics)),
          channel_(std::move(channel)) {}

    StagingControlImpl::~StagingControlImpl()
    {
      RequestShutdown();
    }

    void StagingControlImpl::RequestShutdown()
    {
      shutdown_.store(true, std::memory_order_release);
    }

    void StagingControlImpl::ToProto(const staging::StagedRequest &in, v1::StagedRequest *out)
    {
      out->set_id(in.id);
      out->mutable_requester()->set_id(in.requester.id);
      out->mutable_requester()->set_name(in.requester.name);
      out->set_command_text(in.command_text);
      out->set_timestamp_ms(in.timestamp_ms);
      out->set_status(ToProtoStatus(in.status));
      if (in.reviewer)
      {
        out->mutable_reviewer()->set_id(in.reviewer->id);
        out->mutable_reviewer()->set_name(in.reviewer->name);
      }
      if (in.justification)
      {
        out->set_justification(*in.justification);
      }
    }

    staging::Principal StagingControlImpl::FromProto(const v1::Principal &in)
    {
      return staging::Principal{in.id(), in.name()};
    }

    grpc::Status StagingControlImpl::StageCommand(grpc::ServerContext * /*context*/,
                                                  const v1::StageCommandRequest *request,
                                                  v1::StageCommandResponse *response)
    {
      const staging::Principal requester =
          request->has_requester() && !request->requester().id().empty()
              ? FromProto(request->requester())
              : staging::ConsolePrincipal();

      const staging::StageResult result =
          engine_->Stage(requester, request->command_text(), !request->disallow_auto_approve());

      response->set_outcome(ToProtoOutcome(result.outcome));
      response->set_message(result.message);
      if (result.request)
      {
        ToProto(*result.request, response->mutable_request());
      }

      if (!result.accepted())
      {
        std::ostringstream oss;
        oss << "[StageCommand] REJECTED requester=" << requester.name
            << " outcome=" << staging::StageOutcomeName(result.outcome);
        util::Logger::Debug(oss.str());
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, result.message);
      }
      return grpc::Status::OK;
    }

    grpc::Status StagingControlImpl::Decide(const v1::DecisionRequest *request, bool approve,
                                            v1::DecisionResponse *response)
    {
      if (request->request_id().empty())
      {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "request_id is required");
      }

      std::optional<staging::Principal> reviewer;
      if (request->has_reviewer() && !request->reviewer().id().empty())
      {
        reviewer = FromProto(request->reviewer());
      }
      std::optional<std::string> justification;
      if (request->has_justification())
      {
        justification = request->justification();
      }

      const bool ok = approve
                          ? engine_->Approve(request->request_id(), reviewer, justification)
                          : engine_->Reject(request->request_id(), reviewer, justification);
      response->set_success(ok);
      if (!ok)
      {
        // Already decided, expired or unknown: a no-op, reported in the body.
        response->set_message("request " + request->request_id() + " is not pending");
        return grpc::Status::OK;
      }
      response->set_message(approve ? "approved" : "rejected");
      return grpc::Status::OK;
    }

    grpc::Status StagingControlImpl::ApproveRequest(grpc::ServerContext * /*context*/,
                                                    const v1::DecisionRequest *request,
                                                    v1::DecisionResponse *response)
    {
      return Decide(request, true, response);
    }

    grpc::Status StagingControlImpl::RejectRequest(grpc::ServerContext * /*context*/,
                                                   const v1::DecisionRequest *request,
                                                   v1::DecisionResponse *response)
    {
      return Decide(request, false, response);
    }

    grpc::Status StagingControlImpl::ListPending(grpc::ServerContext * /*context*/,
                                                 const v1::ListPendingRequest * /*request*/,
                                                 v1::ListPendingResponse *response)
    {
      for (const auto &r : engine_->ListPending())
      {
        ToProto(r, response->add_requests());
      }
      return grpc::Status::OK;
    }

    grpc::Status StagingControlImpl::GetHistory(grpc::ServerContext * /*context*/,
                                                const v1::GetHistoryRequest *request,
                                                v1::GetHistoryResponse *response)
    {
      if (request->requester_id().empty())
      {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "requester_id is required");
      }
      const auto entries =
          request->limit() == 0
              ? engine_->History().HistoryFor(request->requester_id())
              : engine_->History().RecentHistoryFor(request->requester_id(), request->limit());
      for (const auto &r : entries)
      {
        ToProto(r, response->add_entries());
      }
      return grpc::Status::OK;
    }

    grpc::Status StagingControlImpl::GetDiagnostics(grpc::ServerContext * /*context*/,
                                                    const v1::GetDiagnosticsRequest * /*request*/,
                                                    v1::GetDiagnosticsResponse *response)
    {
      std::ostringstream report;
      if (resilient_store_)
      {
        response->set_circuit_state(store::CircuitStateName(resilient_store_->State()));
        response->set_consecutive_failures(resilient_store_->ConsecutiveFailures());
        response->set_circuit_open(resilient_store_->IsCircuitOpen());
        report << resilient_store_->StatusReport() << "\n";
      }
      else
      {
        response->set_circuit_state("DISABLED");
        report << "Retry layer disabled (--no-retry)\n\n";
      }

      const uint64_t expired = engine_->ExpiredTotal();
      const telemetry::StagingMetrics::Snapshot s = metrics_->Get();
      response->set_pending_count(static_cast<uint32_t>(engine_->PendingCount()));
      response->set_expired_total(expired);
      response->set_staged_total(s.staged);
      response->set_approved_total(s.approved);
      response->set_rejected_total(s.rejected);
      response->set_auto_approved_total(s.auto_approved);
      response->set_average_review_time(metrics_->FormattedAverageReviewTime());
      response->set_approval_rate(metrics_->ApprovalRate());
      response->set_rejection_rate(metrics_->RejectionRate());
      report << metrics_->Report(expired);
      response->set_report(report.str());
      return grpc::Status::OK;
    }

    grpc::Status StagingControlImpl::ResetCircuitBreaker(
        grpc::ServerContext * /*context*/,
        const v1::ResetCircuitBreakerRequest * /*request*/,
        v1::ResetCircuitBreakerResponse *response)
    {
      if (!resilient_store_)
      {
        response->set_success(false);
        response->set_message("retry layer disabled");
        return grpc::Status::OK;
      }
      resilient_store_->ResetCircuitBreaker();
      response->set_success(true);
      response->set_message("circuit breaker reset");
      return grpc::Status::OK;
    }

    grpc::Status StagingControlImpl::SetPrincipalPresence(
        grpc::ServerContext * /*context*/,
        const v1::SetPrincipalPresenceRequest *request,
        v1::SetPrincipalPresenceResponse * /*response*/)
    {
      if (request->principal_id().empty())
      {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "principal_id is required");
      }
      channel_->SetPresence(request->principal_id(), request->active());
      std::ostringstream oss;
      oss << "[SetPrincipalPresence] principal_id=" << request->principal_id()
          << " active=" << (request->active() ? "true" : "false");
      util::Logger::Debug(oss.str());
      return grpc::Status::OK;
    }

    grpc::Status StagingControlImpl::SubscribeDispatches(
        grpc::ServerContext *context,
        const v1::SubscribeDispatchesRequest * /*request*/,
        grpc::ServerWriter<v1::DispatchedCommand> *writer)
    {
      auto subscription = channel_->Subscribe();
      util::Logger::Info("[SubscribeDispatches] Host subscribed");
      std::optional<execution::DispatchRecord> unwritten;

      while (!context->IsCancelled() && !shutdown_.load(std::memory_order_acquire))
      {
        std::optional<execution::DispatchRecord> record = subscription->WaitNext(kStreamPollInterval);
        if (!record)
        {
          continue;
        }
        v1::DispatchedCommand msg;
        msg.set_sequence(record->sequence);
        msg.mutable_actor()->set_id(record->actor.id);
        msg.mutable_actor()->set_name(record->actor.name);
        msg.set_command_text(record->command_text);
        if (!writer->Write(msg))
        {
          std::ostringstream oss;
          oss << "[SubscribeDispatches] WRITE_FAILED sequence=" << record->sequence;
          util::Logger::Warn(oss.str());
          unwritten = std::move(record);
          break;
        }
      }

      channel_->Unsubscribe(subscription, std::move(unwritten));
      util::Logger::Info("[SubscribeDispatches] Host unsubscribed");
      return grpc::Status::OK;
    }

  } // namespace service
} // namespace stagegate
