#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "supervisor/services/v1/supervisor_telemetry_service.grpc.pb.h"
#include "internal/service/telemetry_service.hpp"

namespace supervisor::grpc {

class TelemetryServer final : public supervisor::services::v1::SupervisorTelemetryService::Service {
public:
  explicit TelemetryServer(std::shared_ptr<supervisor::service::TelemetryService> svc);

  ::grpc::Status Emit(::grpc::ServerContext*,
                      const supervisor::services::v1::EmitRequest*,
                      supervisor::services::v1::EmitResponse*) override;

private:
  std::shared_ptr<supervisor::service::TelemetryService> service_;
};

}
