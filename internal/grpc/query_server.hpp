#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "supervisor/services/v1/supervisor_query_service.grpc.pb.h"
#include "internal/service/query_service.hpp"

namespace supervisor::grpc {

class QueryServer final : public supervisor::services::v1::SupervisorQueryService::Service {
public:
  explicit QueryServer(std::shared_ptr<supervisor::service::QueryService> svc);

  ::grpc::Status EffectiveStatus(::grpc::ServerContext*,
                                 const supervisor::services::v1::EffectiveStatusRequest*,
                                 supervisor::core::v1::EffectiveStatus*) override;

  ::grpc::Status ListInstances(::grpc::ServerContext*,
                               const supervisor::services::v1::ListInstancesRequest*,
                               supervisor::services::v1::ListInstancesResponse*) override;

  ::grpc::Status GetExecution(::grpc::ServerContext*,
                              const supervisor::services::v1::GetExecutionRequest*,
                              supervisor::core::v1::Execution*) override;

  ::grpc::Status GetTranscript(::grpc::ServerContext*,
                               const supervisor::services::v1::GetTranscriptRequest*,
                               supervisor::services::v1::GetTranscriptResponse*) override;

  ::grpc::Status ListToolUses(::grpc::ServerContext*,
                              const supervisor::services::v1::ListToolUsesRequest*,
                              supervisor::services::v1::ListToolUsesResponse*) override;

  ::grpc::Status GetAssertionSummary(::grpc::ServerContext*,
                                     const supervisor::services::v1::GetAssertionSummaryRequest*,
                                     supervisor::core::v1::AssertionSummary*) override;

  ::grpc::Status Subscribe(::grpc::ServerContext*,
                           const supervisor::services::v1::SubscribeRequest*,
                           ::grpc::ServerWriter<supervisor::services::v1::SubscribeResponse>*) override;

private:
  std::shared_ptr<supervisor::service::QueryService> service_;
};

}
