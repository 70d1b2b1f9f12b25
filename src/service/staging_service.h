// Repository: Stagegate
// Component: StagingControl gRPC Service Implementation
// Purpose: Thin adapter from stagegate.v1.StagingControl to LifecycleEngine,
//          ResilientStore diagnostics and the host dispatch channel.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_SERVICE_STAGING_SERVICE_H_
#define STAGEGATE_SERVICE_STAGING_SERVICE_H_

#include <atomic>
#include <chrono>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "stagegate/v1/staging.grpc.pb.h"
#include "stagegate/v1/staging.pb.h"
#include "stagegate/execution/HostDispatchChannel.hpp"
#include "stagegate/staging/LifecycleEngine.hpp"
#include "stagegate/store/ResilientStore.hpp"
#include "stagegate/telemetry/StagingMetrics.hpp"

namespace stagegate {
namespace service {

// Every RPC delegates to the injected collaborators; the service holds no
// staging state of its own.
//
// Status mapping:
//   StageCommand with an invalid command  -> INVALID_ARGUMENT
//   Approve/Reject of a non-pending id    -> NOT_FOUND
//   Empty request_id / requester_id       -> INVALID_ARGUMENT
class StagingControlImpl final : public v1::StagingControl::Service {
 public:
  // resilient_store may be null when the daemon runs without the retry layer.
  StagingControlImpl(std::shared_ptr<staging::LifecycleEngine> engine,
                     std::shared_ptr<store::ResilientStore> resilient_store,
                     std::shared_ptr<telemetry::StagingMetrics> metrics,
                     std::shared_ptr<execution::HostDispatchChannel> channel);
  ~StagingControlImpl() override;

  // Disable copy and move
  StagingControlImpl(const StagingControlImpl&) = delete;
  StagingControlImpl& operator=(const StagingControlImpl&) = delete;

  // Ends every open SubscribeDispatches stream. Call before Server::Shutdown.
  void RequestShutdown();

  // RPC implementations
  grpc::Status StageCommand(grpc::ServerContext* context,
                            const v1::StageCommandRequest* request,
                            v1::StageCommandResponse* response) override;

  grpc::Status ApproveRequest(grpc::ServerContext* context,
                              const v1::DecisionRequest* request,
                              v1::DecisionResponse* response) override;

  grpc::Status RejectRequest(grpc::ServerContext* context,
                             const v1::DecisionRequest* request,
                             v1::DecisionResponse* response) override;

  grpc::Status ListPending(grpc::ServerContext* context,
                           const v1::ListPendingRequest* request,
                           v1::ListPendingResponse* response) override;

  grpc::Status GetHistory(grpc::ServerContext* context,
                          const v1::GetHistoryRequest* request,
                          v1::GetHistoryResponse* response) override;

  grpc::Status GetDiagnostics(grpc::ServerContext* context,
                              const v1::GetDiagnosticsRequest* request,
                              v1::GetDiagnosticsResponse* response) override;

  grpc::Status ResetCircuitBreaker(grpc::ServerContext* context,
                                   const v1::ResetCircuitBreakerRequest* request,
                                   v1::ResetCircuitBreakerResponse* response) override;

  grpc::Status SetPrincipalPresence(grpc::ServerContext* context,
                                    const v1::SetPrincipalPresenceRequest* request,
                                    v1::SetPrincipalPresenceResponse* response) override;

  // Server-streaming RPC. The host executes each DispatchedCommand it reads.
  grpc::Status SubscribeDispatches(grpc::ServerContext* context,
                                   const v1::SubscribeDispatchesRequest* request,
                                   grpc::ServerWriter<v1::DispatchedCommand>* writer) override;

  // Proto conversion (exposed for tests).
  static void ToProto(const staging::StagedRequest& in, v1::StagedRequest* out);
  static staging::Principal FromProto(const v1::Principal& in);

 private:
  static constexpr std::chrono::milliseconds kStreamPollInterval{200};

  grpc::Status Decide(const v1::DecisionRequest* request, bool approve,
                      v1::DecisionResponse* response);

  std::shared_ptr<staging::LifecycleEngine> engine_;
  std::shared_ptr<store::ResilientStore> resilient_store_;
  std::shared_ptr<telemetry::StagingMetrics> metrics_;
  std::shared_ptr<execution::HostDispatchChannel> channel_;
  std::atomic<bool> shutdown_{false};
};

}  // namespace service
}  // namespace stagegate

#endif  // STAGEGATE_SERVICE_STAGING_SERVICE_H_
