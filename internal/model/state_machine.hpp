#pragma once

#include "supervisor/core/v1/types.pb.h"

namespace supervisor::model {

using supervisor::core::v1::InstanceStatus;

/*
  Instance lifecycle DAG:

    pending -> running -> {completed, failed, terminated}

  Terminal states are immutable.
*/

constexpr bool IsTerminal(InstanceStatus status) {
  return status == supervisor::core::v1::INSTANCE_STATUS_COMPLETED || status == supervisor::core::v1::INSTANCE_STATUS_FAILED ||
         status == supervisor::core::v1::INSTANCE_STATUS_TERMINATED;
}

// termination_reason is recorded only for these.
constexpr bool CarriesReason(InstanceStatus status) {
  return status == supervisor::core::v1::INSTANCE_STATUS_FAILED || status == supervisor::core::v1::INSTANCE_STATUS_TERMINATED;
}

// Heartbeats and process attachment are accepted only here.
constexpr bool IsLive(InstanceStatus status) {
  return status == supervisor::core::v1::INSTANCE_STATUS_PENDING || status == supervisor::core::v1::INSTANCE_STATUS_RUNNING;
}

constexpr bool CanTransition(InstanceStatus from, InstanceStatus to) {
  if (from == supervisor::core::v1::INSTANCE_STATUS_PENDING) {
    return to == supervisor::core::v1::INSTANCE_STATUS_RUNNING;
  }
  if (from == supervisor::core::v1::INSTANCE_STATUS_RUNNING) {
    return IsTerminal(to);
  }
  return false;
}

const char* StatusName(InstanceStatus status);

} // namespace supervisor::model
