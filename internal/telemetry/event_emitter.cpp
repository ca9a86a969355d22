#include "event_emitter.hpp"

#include <functional>
#include <optional>

#include "internal/db/db_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/spans.hpp"
#include "internal/stream/fanout.hpp"
#include "internal/telemetry/transcript_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "supervisor/v1.hpp"

namespace supervisor::telemetry {

using namespace supervisor::v1;

EventEmitter::EventEmitter(std::shared_ptr<supervisor::db::Repository> repository, std::shared_ptr<supervisor::stream::StreamFanout> fanout,
                           std::shared_ptr<supervisor::util::Clock> clock)
    : repository_(std::move(repository)), fanout_(std::move(fanout)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = std::make_shared<supervisor::util::WallClock>();
  }
}

std::mutex& EventEmitter::ExecutionShard(const std::string& execution_id) {
  return execution_mu_[std::hash<std::string>{}(execution_id) % kExecutionLockShardCount];
}

EmitResponse EventEmitter::Emit(const EmitRequest& req, EmitOrigin origin) {
  if (req.execution_id().empty() || req.instance_id().empty()) {
    throw supervisor::util::InvalidArgument("emit: execution_id and instance_id are required");
  }
  if (req.entry_type() == ENTRY_TYPE_UNSPECIFIED || !EntryType_IsValid(req.entry_type())) {
    throw supervisor::util::InvalidArgument("emit: entry_type is required");
  }

  supervisor::db::model::TranscriptEntryRecord entry;
  entry.entry_id     = supervisor::util::NewId();
  entry.execution_id = req.execution_id();
  entry.instance_id  = req.instance_id();
  entry.entry_type   = req.entry_type();
  entry.category     = req.category();
  entry.summary      = req.summary();
  entry.payload_json = PayloadToJson(req.payload());

  // Validate projections up front so a malformed payload never reaches the store.
  std::optional<supervisor::db::model::ToolUseRecord>         tool_use;
  std::optional<supervisor::db::model::AssertionResultRecord> assertion;
  if (req.entry_type() == ENTRY_TYPE_TOOL_USE) {
    tool_use = ToolUseFromPayload(entry, req.payload());
  } else if (req.entry_type() == ENTRY_TYPE_ASSERTION) {
    assertion = AssertionFromPayload(entry, req.payload());
  }

  std::lock_guard<std::mutex> lock(ExecutionShard(req.execution_id()));

  auto tx = repository_->Begin();

  const auto execution = repository_->GetExecution(*tx, req.execution_id());
  if (!execution.has_value()) {
    throw supervisor::util::InvalidArgument("emit: execution " + req.execution_id() + " does not exist");
  }
  if (execution->instance_id != req.instance_id()) {
    throw supervisor::util::InvalidArgument("emit: execution " + req.execution_id() + " does not belong to instance " + req.instance_id());
  }
  if (!req.task_id().empty() && req.task_id() != execution->task_id) {
    throw supervisor::util::InvalidArgument("emit: task_id does not match execution " + req.execution_id());
  }
  entry.task_id = execution->task_id;

  if (origin == EmitOrigin::kWorker) {
    const auto instance = repository_->GetInstance(*tx, req.instance_id());
    if (instance.has_value() && supervisor::model::IsTerminal(instance->status)) {
      throw supervisor::util::InstanceTerminated("emit: instance " + req.instance_id() + " is " + supervisor::model::StatusName(instance->status));
    }
  }

  entry.committed_at_ms = clock_->NowMs();
  supervisor::db::ThrowIfDbError(repository_->AppendTranscriptEntry(*tx, entry), "emit: append transcript entry");

  if (tool_use.has_value()) {
    tool_use->sequence = entry.sequence;
    supervisor::db::ThrowIfDbError(repository_->InsertToolUse(*tx, *tool_use), "emit: tool_use projection");
  }
  if (assertion.has_value()) {
    assertion->sequence = entry.sequence;
    supervisor::db::ThrowIfDbError(repository_->InsertAssertionResult(*tx, *assertion), "emit: assertion projection");
  }

  tx->Commit();
  supervisor::observability::Metrics::Instance().RecordEntryCommitted(EntryType_Name(entry.entry_type));

  if (fanout_) {
    fanout_->Publish(ToProto(entry));
  }

  EmitResponse resp;
  resp.set_entry_id(entry.entry_id);
  resp.set_sequence(entry.sequence);
  return resp;
}

} // namespace supervisor::telemetry
