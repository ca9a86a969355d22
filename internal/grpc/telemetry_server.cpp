#include "telemetry_server.hpp"
#include "grpc_error.hpp"

namespace supervisor::grpc {

TelemetryServer::TelemetryServer(std::shared_ptr<supervisor::service::TelemetryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status TelemetryServer::Emit(::grpc::ServerContext*,
                                     const supervisor::services::v1::EmitRequest* req,
                                     supervisor::services::v1::EmitResponse* resp) {
  try {
    *resp = service_->Emit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
