#pragma once

#include <memory>

#include "service_context.hpp"
#include "supervisor/services/v1/supervisor_query_service.pb.h"

namespace supervisor::stream { class Subscription; }

namespace supervisor::service {

class QueryService {
 public:
  explicit QueryService(ServiceContext ctx);

  supervisor::core::v1::EffectiveStatus EffectiveStatus(const supervisor::services::v1::EffectiveStatusRequest& req);

  supervisor::services::v1::ListInstancesResponse ListInstances(const supervisor::services::v1::ListInstancesRequest& req);

  supervisor::core::v1::Execution GetExecution(const supervisor::services::v1::GetExecutionRequest& req);

  supervisor::services::v1::GetTranscriptResponse GetTranscript(const supervisor::services::v1::GetTranscriptRequest& req);

  supervisor::services::v1::ListToolUsesResponse ListToolUses(const supervisor::services::v1::ListToolUsesRequest& req);

  supervisor::core::v1::AssertionSummary GetAssertionSummary(const supervisor::services::v1::GetAssertionSummaryRequest& req);

  // Caller drains the subscription and hands it back to Unsubscribe.
  std::shared_ptr<supervisor::stream::Subscription> Subscribe(const supervisor::services::v1::SubscribeRequest& req);

  void Unsubscribe(const std::shared_ptr<supervisor::stream::Subscription>& subscription);

  uint64_t StreamPollIntervalMs() const { return ctx_.options.stream.poll_interval_ms; }

 private:
  ServiceContext ctx_;
};

} // namespace supervisor::service
