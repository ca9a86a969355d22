#include "instance_codec.hpp"

#include "internal/util/time.hpp"

namespace supervisor::registry {

supervisor::core::v1::AgentInstance ToProto(const supervisor::db::model::InstanceRecord& record) {
  supervisor::core::v1::AgentInstance instance;
  instance.set_instance_id(record.instance_id);
  instance.set_task_id(record.task_id);
  instance.set_task_list_id(record.task_list_id);
  instance.set_status(record.status);
  instance.set_pid(record.pid);
  instance.set_hostname(record.hostname);
  *instance.mutable_started_at() = supervisor::util::MillisToProto(record.started_at_ms);
  if (record.last_heartbeat_at_ms > 0) {
    *instance.mutable_last_heartbeat_at() = supervisor::util::MillisToProto(record.last_heartbeat_at_ms);
  }
  instance.set_heartbeat_count(record.heartbeat_count);
  instance.set_termination_reason(record.termination_reason);
  if (record.terminated_at_ms > 0) {
    *instance.mutable_terminated_at() = supervisor::util::MillisToProto(record.terminated_at_ms);
  }
  return instance;
}

supervisor::core::v1::Execution ToProto(const supervisor::db::model::ExecutionRecord& record) {
  supervisor::core::v1::Execution execution;
  execution.set_execution_id(record.execution_id);
  execution.set_instance_id(record.instance_id);
  execution.set_task_id(record.task_id);
  *execution.mutable_started_at() = supervisor::util::MillisToProto(record.started_at_ms);
  if (record.completed_at_ms > 0) {
    *execution.mutable_completed_at() = supervisor::util::MillisToProto(record.completed_at_ms);
  }
  execution.set_outcome(record.outcome);
  return execution;
}

} // namespace supervisor::registry
