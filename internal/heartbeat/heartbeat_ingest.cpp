#include "heartbeat_ingest.hpp"

#include <stdexcept>

#include "internal/db/db_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/telemetry/resilient_emitter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "supervisor/v1.hpp"

namespace supervisor::heartbeat {

using namespace supervisor::v1;
using supervisor::observability::StringField;

namespace {

constexpr int kMaxCasAttempts = 8;

bool IsTimestampSet(const google::protobuf::Timestamp& ts) {
  return ts.seconds() != 0 || ts.nanos() != 0;
}

} // namespace

HeartbeatIngest::HeartbeatIngest(std::shared_ptr<supervisor::registry::InstanceRegistry> registry,
                                 std::shared_ptr<supervisor::telemetry::ResilientEmitter> emitter, supervisor::config::LivenessOptions options)
    : registry_(std::move(registry)), emitter_(std::move(emitter)), options_(options) {
  if (!registry_) {
    throw std::invalid_argument("heartbeat ingest requires an instance registry");
  }
}

HeartbeatResponse HeartbeatIngest::Heartbeat(const HeartbeatRequest& req) {
  if (req.instance_id().empty()) {
    throw supervisor::util::InvalidArgument("heartbeat: instance_id is required");
  }

  const uint64_t timestamp_ms = IsTimestampSet(req.timestamp()) ? supervisor::util::ProtoToMillis(req.timestamp()) : registry_->NowMs();

  auto& repo = registry_->Store();

  const bool record_detail = req.has_detail() && options_.record_heartbeat_entries && emitter_;

  HeartbeatResponse resp;
  std::string       task_id;
  std::string       execution_id;
  bool              done = false;
  {
    auto lock = registry_->LockInstance(req.instance_id());

    for (int attempt = 0; attempt < kMaxCasAttempts && !done; ++attempt) {
      auto tx     = repo.Begin();
      auto record = repo.GetInstance(*tx, req.instance_id());
      if (!record.has_value()) {
        throw supervisor::util::NotFound("heartbeat: instance " + req.instance_id() + " not found");
      }
      if (supervisor::model::IsTerminal(record->status)) {
        throw supervisor::util::InstanceTerminated("heartbeat: instance " + req.instance_id() + " is " +
                                                   supervisor::model::StatusName(record->status));
      }
      task_id = record->task_id;

      const bool was_pending = record->status == INSTANCE_STATUS_PENDING;
      if (!was_pending && timestamp_ms <= record->last_heartbeat_at_ms) {
        resp.set_accepted(false);
        resp.set_status(record->status);
        *resp.mutable_last_heartbeat_at() = supervisor::util::MillisToProto(record->last_heartbeat_at_ms);
        done = true;
        break;
      }

      const auto expected = record->version;
      if (was_pending) {
        record->status = INSTANCE_STATUS_RUNNING;
      }
      if (timestamp_ms > record->last_heartbeat_at_ms) {
        record->last_heartbeat_at_ms = timestamp_ms;
      }
      ++record->heartbeat_count;

      const auto result = repo.UpdateInstance(*tx, *record, expected);
      if (result.code == supervisor::db::ErrorCode::Conflict) {
        continue;
      }
      supervisor::db::ThrowIfDbError(result, "heartbeat");
      if (record_detail) {
        auto execution = repo.GetExecutionByInstance(*tx, req.instance_id());
        if (execution.has_value()) {
          execution_id = execution->execution_id;
        }
      }
      tx->Commit();

      if (was_pending) {
        SUPERVISOR_LOG_INFO("Instance running on first heartbeat", {StringField("instance_id", req.instance_id())});
      }

      resp.set_accepted(true);
      resp.set_status(record->status);
      *resp.mutable_last_heartbeat_at() = supervisor::util::MillisToProto(record->last_heartbeat_at_ms);
      done = true;
    }
  }

  if (!done) {
    throw supervisor::util::StoreUnavailable("heartbeat: instance " + req.instance_id() + " kept changing concurrently");
  }

  supervisor::observability::Metrics::Instance().RecordHeartbeat(resp.accepted());

  if (resp.accepted() && record_detail && !execution_id.empty()) {
    RecordDetail(req, task_id, execution_id, timestamp_ms);
  }
  return resp;
}

// Store outages are queued by the emitter; the heartbeat is already committed.
void HeartbeatIngest::RecordDetail(const HeartbeatRequest& req, const std::string& task_id, const std::string& execution_id,
                                   uint64_t timestamp_ms) {
  const auto& detail = req.detail();

  EmitRequest emit;
  emit.set_execution_id(execution_id);
  emit.set_instance_id(req.instance_id());
  emit.set_task_id(task_id);
  emit.set_entry_type(ENTRY_TYPE_HEARTBEAT);
  emit.set_category("heartbeat");
  emit.set_summary(detail.current_step().empty() ? "heartbeat" : detail.current_step());

  auto& fields = *emit.mutable_payload()->mutable_fields();
  fields["timestamp_ms"].set_number_value(static_cast<double>(timestamp_ms));
  if (detail.has_progress_percent()) fields["progress_percent"].set_number_value(detail.progress_percent());
  if (!detail.current_step().empty()) fields["current_step"].set_string_value(detail.current_step());
  if (detail.has_memory_mb()) fields["memory_mb"].set_number_value(detail.memory_mb());
  if (detail.has_cpu_percent()) fields["cpu_percent"].set_number_value(detail.cpu_percent());

  try {
    emitter_->Emit(emit, supervisor::telemetry::EmitOrigin::kWorker);
  } catch (const supervisor::util::InstanceTerminated& ex) {
    // reaped between the heartbeat commit and the detail write
    SUPERVISOR_LOG_DEBUG("Heartbeat detail skipped", {StringField("instance_id", req.instance_id()), StringField("error", ex.what())});
  }
}

} // namespace supervisor::heartbeat
