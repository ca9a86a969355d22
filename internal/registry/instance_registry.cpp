#include "instance_registry.hpp"

#include <functional>
#include <stdexcept>

#include "internal/db/db_errors.hpp"
#include "internal/heartbeat/liveness.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace supervisor::registry {

using supervisor::core::v1::InstanceStatus;
using supervisor::db::ErrorCode;
using supervisor::db::model::InstanceRecord;
using supervisor::observability::StringField;

namespace {

InstanceRecord GetOrThrow(supervisor::db::Repository& repo, supervisor::db::Transaction& tx, const std::string& instance_id,
                          const std::string& op) {
  auto record = repo.GetInstance(tx, instance_id);
  if (!record.has_value()) {
    throw supervisor::util::NotFound(op + ": instance " + instance_id + " not found");
  }
  return *record;
}

void RequireId(const std::string& instance_id, const std::string& op) {
  if (instance_id.empty()) {
    throw supervisor::util::InvalidArgument(op + ": instance_id is required");
  }
}

} // namespace

InstanceRegistry::InstanceRegistry(std::shared_ptr<supervisor::db::Repository> repository, std::shared_ptr<supervisor::util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
  if (!repository_) {
    throw std::invalid_argument("instance registry requires a repository");
  }
  if (!clock_) {
    clock_ = std::make_shared<supervisor::util::WallClock>();
  }
}

std::size_t InstanceRegistry::InstanceShardIndex(const std::string& instance_id) const {
  return std::hash<std::string>{}(instance_id) % kInstanceLockShardCount;
}

std::unique_lock<std::mutex> InstanceRegistry::LockInstance(const std::string& instance_id) {
  return std::unique_lock<std::mutex>(instance_mu_[InstanceShardIndex(instance_id)]);
}

CreatedInstance InstanceRegistry::CreateInstance(const std::string& task_id, const std::string& task_list_id, const std::string& pid,
                                                 const std::string& hostname) {
  if (task_id.empty()) {
    throw supervisor::util::InvalidArgument("create instance: task_id is required");
  }

  const auto now_ms = clock_->NowMs();

  InstanceRecord instance;
  instance.instance_id   = supervisor::util::NewId();
  instance.task_id       = task_id;
  instance.task_list_id  = task_list_id;
  instance.status        = supervisor::core::v1::INSTANCE_STATUS_PENDING;
  instance.pid           = pid;
  instance.hostname      = hostname;
  instance.started_at_ms = now_ms;
  instance.version       = 1;

  supervisor::db::model::ExecutionRecord execution;
  execution.execution_id  = supervisor::util::NewId();
  execution.instance_id   = instance.instance_id;
  execution.task_id       = task_id;
  execution.started_at_ms = now_ms;

  auto lock = LockInstance(instance.instance_id);
  auto tx   = repository_->Begin();
  supervisor::db::ThrowIfDbError(repository_->InsertInstance(*tx, instance), "create instance");
  supervisor::db::ThrowIfDbError(repository_->InsertExecution(*tx, execution), "create execution");
  tx->Commit();

  SUPERVISOR_LOG_INFO("Instance created", {StringField("instance_id", instance.instance_id), StringField("execution_id", execution.execution_id),
                                           StringField("task_id", task_id), StringField("task_list_id", task_list_id)});

  return {instance.instance_id, execution.execution_id};
}

InstanceRecord InstanceRegistry::MarkRunning(const std::string& instance_id) {
  RequireId(instance_id, "mark running");
  auto lock = LockInstance(instance_id);

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    auto tx     = repository_->Begin();
    auto record = GetOrThrow(*repository_, *tx, instance_id, "mark running");

    if (!supervisor::model::CanTransition(record.status, supervisor::core::v1::INSTANCE_STATUS_RUNNING)) {
      throw supervisor::util::InvalidTransition(std::string("mark running: instance is ") + supervisor::model::StatusName(record.status) +
                                                ", expected pending");
    }

    const auto expected = record.version;
    record.status       = supervisor::core::v1::INSTANCE_STATUS_RUNNING;

    const auto result = repository_->UpdateInstance(*tx, record, expected);
    if (result.code == ErrorCode::Conflict) {
      continue;
    }
    supervisor::db::ThrowIfDbError(result, "mark running");
    tx->Commit();
    return record;
  }

  throw supervisor::util::StoreUnavailable("mark running: instance " + instance_id + " kept changing concurrently");
}

TerminalTransition InstanceRegistry::MarkTerminal(const std::string& instance_id, InstanceStatus status, const std::string& reason) {
  RequireId(instance_id, "mark terminal");
  if (!supervisor::model::IsTerminal(status)) {
    throw supervisor::util::InvalidArgument(std::string("mark terminal: ") + supervisor::model::StatusName(status) + " is not a terminal status");
  }

  // completed never carries a reason; failed and terminated always do.
  const std::string normalized_reason = supervisor::model::CarriesReason(status) ? reason : std::string{};
  if (supervisor::model::CarriesReason(status) && normalized_reason.empty()) {
    throw supervisor::util::InvalidArgument(std::string("mark terminal: a reason is required for ") + supervisor::model::StatusName(status));
  }

  return *CommitTerminal(instance_id, status, normalized_reason, nullptr);
}

std::optional<TerminalTransition> InstanceRegistry::MarkTerminalIfStale(const std::string& instance_id, uint64_t stale_timeout_ms,
                                                                        const std::string& reason) {
  RequireId(instance_id, "mark terminal if stale");
  if (reason.empty()) {
    throw supervisor::util::InvalidArgument("mark terminal if stale: a reason is required");
  }
  return CommitTerminal(instance_id, supervisor::core::v1::INSTANCE_STATUS_TERMINATED, reason,
                        [stale_timeout_ms](const InstanceRecord& current, uint64_t now_ms) {
                          return supervisor::heartbeat::IsStale(current, now_ms, stale_timeout_ms);
                        });
}

std::optional<TerminalTransition> InstanceRegistry::CommitTerminal(const std::string& instance_id, InstanceStatus status,
                                                                   const std::string& normalized_reason, const TransitionGuard& guard) {
  auto lock = LockInstance(instance_id);

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    auto tx     = repository_->Begin();
    auto record = GetOrThrow(*repository_, *tx, instance_id, "mark terminal");

    const auto now_ms = clock_->NowMs();
    if (guard && !guard(record, now_ms)) {
      return std::nullopt;
    }

    if (supervisor::model::IsTerminal(record.status)) {
      if (record.status == status && record.termination_reason == normalized_reason) {
        return TerminalTransition{false, record, {}};
      }
      SUPERVISOR_LOG_WARN("Conflicting terminal transition rejected",
                          {StringField("instance_id", instance_id), StringField("stored_status", supervisor::model::StatusName(record.status)),
                           StringField("stored_reason", record.termination_reason),
                           StringField("requested_status", supervisor::model::StatusName(status)), StringField("requested_reason", normalized_reason)});
      throw supervisor::util::ConflictingTransition(std::string("mark terminal: instance already ") + supervisor::model::StatusName(record.status) +
                                                    (record.termination_reason.empty() ? "" : "/" + record.termination_reason));
    }

    if (!supervisor::model::CanTransition(record.status, status)) {
      throw supervisor::util::InvalidTransition(std::string("mark terminal: instance is ") + supervisor::model::StatusName(record.status) +
                                                ", expected running");
    }

    const auto expected = record.version;

    record.status             = status;
    record.termination_reason = normalized_reason;
    record.terminated_at_ms   = now_ms;

    const auto result = repository_->UpdateInstance(*tx, record, expected);
    if (result.code == ErrorCode::Conflict) {
      // Another writer committed first; re-read and judge against its outcome.
      continue;
    }
    supervisor::db::ThrowIfDbError(result, "mark terminal");

    std::string execution_id;
    auto        execution = repository_->GetExecutionByInstance(*tx, instance_id);
    if (execution.has_value()) {
      execution->completed_at_ms = now_ms;
      execution->outcome         = supervisor::model::StatusName(status);
      supervisor::db::ThrowIfDbError(repository_->UpdateExecution(*tx, *execution), "mark terminal: close execution");
      execution_id = execution->execution_id;
    }

    tx->Commit();

    SUPERVISOR_LOG_INFO("Instance reached terminal status", {StringField("instance_id", instance_id),
                                                             StringField("status", supervisor::model::StatusName(status)),
                                                             StringField("reason", normalized_reason)});
    return TerminalTransition{true, record, execution_id};
  }

  throw supervisor::util::StoreUnavailable("mark terminal: instance " + instance_id + " kept changing concurrently");
}

InstanceRecord InstanceRegistry::AttachProcess(const std::string& instance_id, const std::string& pid, const std::string& hostname) {
  RequireId(instance_id, "attach process");
  if (pid.empty()) {
    throw supervisor::util::InvalidArgument("attach process: pid is required");
  }

  auto lock = LockInstance(instance_id);

  for (int attempt = 0; attempt < kMaxCasAttempts; ++attempt) {
    auto tx     = repository_->Begin();
    auto record = GetOrThrow(*repository_, *tx, instance_id, "attach process");

    if (!supervisor::model::IsLive(record.status)) {
      throw supervisor::util::InstanceTerminated("attach process: instance is " + std::string(supervisor::model::StatusName(record.status)));
    }

    const auto expected = record.version;
    record.pid          = pid;
    if (!hostname.empty()) {
      record.hostname = hostname;
    }

    const auto result = repository_->UpdateInstance(*tx, record, expected);
    if (result.code == ErrorCode::Conflict) {
      continue;
    }
    supervisor::db::ThrowIfDbError(result, "attach process");
    tx->Commit();
    return record;
  }

  throw supervisor::util::StoreUnavailable("attach process: instance " + instance_id + " kept changing concurrently");
}

std::optional<InstanceRecord> InstanceRegistry::GetInstance(const std::string& instance_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetInstance(*tx, instance_id);
  tx->Commit();
  return record;
}

} // namespace supervisor::registry
