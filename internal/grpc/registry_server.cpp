#include "registry_server.hpp"
#include "grpc_error.hpp"

namespace supervisor::grpc {

RegistryServer::RegistryServer(std::shared_ptr<supervisor::service::RegistryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RegistryServer::CreateInstance(::grpc::ServerContext*,
                                              const supervisor::services::v1::CreateInstanceRequest* req,
                                              supervisor::services::v1::CreateInstanceResponse* resp) {
  try {
    *resp = service_->CreateInstance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::AttachProcess(::grpc::ServerContext*,
                                             const supervisor::services::v1::AttachProcessRequest* req,
                                             google::protobuf::Empty*) {
  try {
    service_->AttachProcess(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::MarkTerminal(::grpc::ServerContext*,
                                            const supervisor::services::v1::MarkTerminalRequest* req,
                                            supervisor::services::v1::MarkTerminalResponse* resp) {
  try {
    *resp = service_->MarkTerminal(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::Heartbeat(::grpc::ServerContext*,
                                         const supervisor::services::v1::HeartbeatRequest* req,
                                         supervisor::services::v1::HeartbeatResponse* resp) {
  try {
    *resp = service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
