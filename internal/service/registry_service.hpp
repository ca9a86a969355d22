#pragma once

#include "service_context.hpp"
#include "supervisor/services/v1/supervisor_registry_service.pb.h"

namespace supervisor::service {

class RegistryService {
 public:
  explicit RegistryService(ServiceContext ctx);

  supervisor::services::v1::CreateInstanceResponse CreateInstance(const supervisor::services::v1::CreateInstanceRequest& req);

  void AttachProcess(const supervisor::services::v1::AttachProcessRequest& req);

  supervisor::services::v1::MarkTerminalResponse MarkTerminal(const supervisor::services::v1::MarkTerminalRequest& req);

  supervisor::services::v1::HeartbeatResponse Heartbeat(const supervisor::services::v1::HeartbeatRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace supervisor::service
