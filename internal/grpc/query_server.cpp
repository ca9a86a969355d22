#include "query_server.hpp"

#include <chrono>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/stream/fanout.hpp"

namespace supervisor::grpc {

QueryServer::QueryServer(std::shared_ptr<supervisor::service::QueryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status QueryServer::EffectiveStatus(::grpc::ServerContext*,
                                            const supervisor::services::v1::EffectiveStatusRequest* req,
                                            supervisor::core::v1::EffectiveStatus* resp) {
  try {
    *resp = service_->EffectiveStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::ListInstances(::grpc::ServerContext*,
                                          const supervisor::services::v1::ListInstancesRequest* req,
                                          supervisor::services::v1::ListInstancesResponse* resp) {
  try {
    *resp = service_->ListInstances(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetExecution(::grpc::ServerContext*,
                                         const supervisor::services::v1::GetExecutionRequest* req,
                                         supervisor::core::v1::Execution* resp) {
  try {
    *resp = service_->GetExecution(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetTranscript(::grpc::ServerContext*,
                                          const supervisor::services::v1::GetTranscriptRequest* req,
                                          supervisor::services::v1::GetTranscriptResponse* resp) {
  try {
    *resp = service_->GetTranscript(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::ListToolUses(::grpc::ServerContext*,
                                         const supervisor::services::v1::ListToolUsesRequest* req,
                                         supervisor::services::v1::ListToolUsesResponse* resp) {
  try {
    *resp = service_->ListToolUses(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::GetAssertionSummary(::grpc::ServerContext*,
                                                const supervisor::services::v1::GetAssertionSummaryRequest* req,
                                                supervisor::core::v1::AssertionSummary* resp) {
  try {
    *resp = service_->GetAssertionSummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueryServer::Subscribe(::grpc::ServerContext* context,
                                      const supervisor::services::v1::SubscribeRequest* req,
                                      ::grpc::ServerWriter<supervisor::services::v1::SubscribeResponse>* writer) {
  std::shared_ptr<supervisor::stream::Subscription> subscription;
  try {
    subscription = service_->Subscribe(*req);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  const auto poll = std::chrono::milliseconds(service_->StreamPollIntervalMs());
  ::grpc::Status status = ::grpc::Status::OK;

  while (!context->IsCancelled()) {
    auto event = subscription->Next(poll);
    if (!event.has_value()) {
      if (subscription->IsDrained()) {
        break;
      }
      continue;
    }

    const bool is_gap = event->has_gap();
    if (!writer->Write(*event)) {
      break;
    }
    if (is_gap) {
      status = ::grpc::Status(::grpc::StatusCode::RESOURCE_EXHAUSTED, "subscriber fell behind; resubscribe from the gap's last delivered sequence");
      break;
    }
  }

  service_->Unsubscribe(subscription);
  SUPERVISOR_LOG_DEBUG("Subscriber detached", {supervisor::observability::StringField("execution_id", req->execution_id())});
  return status;
}

}
