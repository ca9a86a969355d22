#pragma once

#include "service_context.hpp"
#include "supervisor/services/v1/supervisor_telemetry_service.pb.h"

namespace supervisor::service {

class TelemetryService {
 public:
  explicit TelemetryService(ServiceContext ctx);

  supervisor::services::v1::EmitResponse Emit(const supervisor::services::v1::EmitRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace supervisor::service
