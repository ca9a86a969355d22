#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "supervisor/services/v1/supervisor_registry_service.grpc.pb.h"
#include "internal/service/registry_service.hpp"

namespace supervisor::grpc {

class RegistryServer final : public supervisor::services::v1::SupervisorRegistryService::Service {
public:
  explicit RegistryServer(std::shared_ptr<supervisor::service::RegistryService> svc);

  ::grpc::Status CreateInstance(::grpc::ServerContext*,
                                const supervisor::services::v1::CreateInstanceRequest*,
                                supervisor::services::v1::CreateInstanceResponse*) override;

  ::grpc::Status AttachProcess(::grpc::ServerContext*,
                               const supervisor::services::v1::AttachProcessRequest*,
                               google::protobuf::Empty*) override;

  ::grpc::Status MarkTerminal(::grpc::ServerContext*,
                              const supervisor::services::v1::MarkTerminalRequest*,
                              supervisor::services::v1::MarkTerminalResponse*) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext*,
                           const supervisor::services::v1::HeartbeatRequest*,
                           supervisor::services::v1::HeartbeatResponse*) override;

private:
  std::shared_ptr<supervisor::service::RegistryService> service_;
};

}
