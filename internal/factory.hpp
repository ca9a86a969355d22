#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"

namespace supervisor::telemetry {
class ResilientEmitter;
}

namespace supervisor::factory {

// Everything the daemon keeps alive between startup and shutdown.
struct Application {
  service::ServiceContext ctx;

  // supervisor-side writes parked while the store was down; flushed on exit
  std::shared_ptr<telemetry::ResilientEmitter> supervisor_emitter;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Wires repository, registry, ingest, emitters, fanout, query and reaper
  from the runtime config. Concrete store types are only named here.
  The reaper is started before returning.
*/
Application Build(const supervisor::runtime::config::RuntimeConfig& config);

// Selected repository with its schema applied.
std::shared_ptr<db::Repository> BuildRepository(const supervisor::runtime::config::RuntimeConfig& config,
                                                const supervisor::config::SupervisorOptions& options);

} // namespace supervisor::factory
