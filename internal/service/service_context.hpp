#pragma once

#include <memory>

#include "internal/config/supervisor_options.hpp"

namespace supervisor::registry { class InstanceRegistry; }
namespace supervisor::heartbeat { class HeartbeatIngest; }
namespace supervisor::telemetry { class EventEmitter; }
namespace supervisor::query { class ReconciledStateQuery; }
namespace supervisor::stream { class StreamFanout; }
namespace supervisor::reaper { class LivenessReaper; }
namespace supervisor::db { class Repository; }

namespace supervisor::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<supervisor::db::Repository> repository;
  std::shared_ptr<supervisor::registry::InstanceRegistry> registry;
  std::shared_ptr<supervisor::heartbeat::HeartbeatIngest> heartbeat;
  std::shared_ptr<supervisor::telemetry::EventEmitter> emitter;
  std::shared_ptr<supervisor::query::ReconciledStateQuery> query;
  std::shared_ptr<supervisor::stream::StreamFanout> fanout;
  std::shared_ptr<supervisor::reaper::LivenessReaper> reaper;
  supervisor::config::SupervisorOptions options;
};

}
