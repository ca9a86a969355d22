#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/config/supervisor_options.hpp"
#include "supervisor/services/v1/supervisor_registry_service.pb.h"

namespace supervisor::registry {
class InstanceRegistry;
}
namespace supervisor::telemetry {
class ResilientEmitter;
}

namespace supervisor::heartbeat {

/*
  The only path by which an instance claims to be alive.

  The first heartbeat of a pending instance moves it to running in the
  same compare-and-swap that stores the heartbeat.
*/
class HeartbeatIngest {
 public:
  HeartbeatIngest(std::shared_ptr<supervisor::registry::InstanceRegistry> registry, std::shared_ptr<supervisor::telemetry::ResilientEmitter> emitter,
                  supervisor::config::LivenessOptions options);

  supervisor::services::v1::HeartbeatResponse Heartbeat(const supervisor::services::v1::HeartbeatRequest& req);

 private:
  void RecordDetail(const supervisor::services::v1::HeartbeatRequest& req, const std::string& task_id, const std::string& execution_id,
                    uint64_t timestamp_ms);

  std::shared_ptr<supervisor::registry::InstanceRegistry>    registry_;
  std::shared_ptr<supervisor::telemetry::ResilientEmitter> emitter_;
  supervisor::config::LivenessOptions                        options_;
};

} // namespace supervisor::heartbeat
