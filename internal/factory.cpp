#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/query_server.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/grpc/telemetry_server.hpp"
#include "internal/heartbeat/heartbeat_ingest.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/reconciled_state_query.hpp"
#include "internal/reaper/liveness_reaper.hpp"
#include "internal/reaper/process_controller.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/service/query_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/telemetry_service.hpp"
#include "internal/stream/fanout.hpp"
#include "internal/telemetry/event_emitter.hpp"
#include "internal/telemetry/resilient_emitter.hpp"
#include "internal/util/time.hpp"
#if SUPERVISOR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SUPERVISOR_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace supervisor::factory {

using namespace supervisor;
using supervisor::observability::StringField;

namespace {

util::BackoffPolicy ToBackoffPolicy(const config::StoreRetryOptions& options) {
  util::BackoffPolicy policy;
  policy.max_attempts       = options.max_attempts;
  policy.initial_backoff_ms = options.initial_backoff_ms;
  policy.max_backoff_ms     = options.max_backoff_ms;
  policy.multiplier         = options.backoff_multiplier;
  return policy;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const supervisor::runtime::config::RuntimeConfig& config,
                                                const supervisor::config::SupervisorOptions& options) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SUPERVISOR_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::invalid_argument("database.sqlite.path is required");
    }
    auto sqlite_db =
        std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options.store_retry.operation_timeout_ms, database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    SUPERVISOR_LOG_INFO("Using sqlite store", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SUPERVISOR_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool =
        std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections, options.store_retry.operation_timeout_ms);
    {
      db::postgres::PgMigrationExecutor executor(pool);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
    }
    SUPERVISOR_LOG_INFO("Using postgres store");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SUPERVISOR_LOG_WARN("Using in-memory store; state is lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const supervisor::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto options = config::ResolveOptions(config);
  auto       clock   = std::make_shared<util::WallClock>();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config, options);
  auto fanout     = std::make_shared<stream::StreamFanout>(repository, options.stream.subscriber_queue_capacity);
  auto emitter    = std::make_shared<telemetry::EventEmitter>(repository, fanout, clock);
  auto instances  = std::make_shared<registry::InstanceRegistry>(repository, clock);
  auto reads      = std::make_shared<query::ReconciledStateQuery>(repository, clock, options.liveness);

  // Supervisor-side writes (heartbeat detail, reap records) go through the
  // resilient path so a store outage does not lose them.
  auto resilient = std::make_shared<telemetry::ResilientEmitter>(emitter, ToBackoffPolicy(options.store_retry),
                                                                 options.store_retry.local_queue_capacity);
  auto ingest    = std::make_shared<heartbeat::HeartbeatIngest>(instances, resilient, options.liveness);

  // ------------------------------------------------------------------
  // Reaper
  // ------------------------------------------------------------------
  std::shared_ptr<reaper::LivenessReaper> liveness_reaper;
  if (options.reaper.enabled) {
    liveness_reaper = std::make_shared<reaper::LivenessReaper>(instances, resilient, std::make_shared<reaper::PosixProcessController>(),
                                                               options.liveness, options.reaper);
    liveness_reaper->Start();
  } else {
    SUPERVISOR_LOG_WARN("Liveness reaper disabled; stale instances are reported but never demoted");
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto& ctx      = app.ctx;
  ctx.repository = repository;
  ctx.registry   = instances;
  ctx.heartbeat  = ingest;
  ctx.emitter    = emitter;
  ctx.query      = reads;
  ctx.fanout     = fanout;
  ctx.reaper     = liveness_reaper;
  ctx.options    = options;

  app.supervisor_emitter = resilient;

  auto registry_service  = std::make_shared<service::RegistryService>(ctx);
  auto telemetry_service = std::make_shared<service::TelemetryService>(ctx);
  auto query_service     = std::make_shared<service::QueryService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RegistryServer>(registry_service));
  app.grpc_services.push_back(std::make_unique<grpc::TelemetryServer>(telemetry_service));
  app.grpc_services.push_back(std::make_unique<grpc::QueryServer>(query_service));

  return app;
}

} // namespace supervisor::factory
