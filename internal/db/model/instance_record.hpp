#pragma once

#include <cstdint>
#include <string>

#include "supervisor/core/v1/types.pb.h"

namespace supervisor::db::model {

/*
  Persistent agent instance row.

  IMPORTANT:
  - Status is only changed through a compare-and-swap on version.
  - last_heartbeat_at_ms == 0 means no heartbeat was ever accepted.
  - termination_reason is non-empty iff status is failed or terminated.
*/

struct InstanceRecord {
  std::string instance_id;
  std::string task_id;
  std::string task_list_id;

  supervisor::core::v1::InstanceStatus status = supervisor::core::v1::INSTANCE_STATUS_UNSPECIFIED;

  std::string pid; // opaque process handle, empty = unknown
  std::string hostname;

  uint64_t started_at_ms        = 0;
  uint64_t last_heartbeat_at_ms = 0;
  uint64_t heartbeat_count      = 0;

  std::string termination_reason;
  uint64_t    terminated_at_ms = 0;

  // CAS counter, bumped on every committed update
  uint64_t version = 0;
};

} // namespace supervisor::db::model
