#include "state_machine.hpp"

namespace supervisor::model {

const char* StatusName(InstanceStatus status) {
  switch (status) {
    case supervisor::core::v1::INSTANCE_STATUS_PENDING:
      return "pending";
    case supervisor::core::v1::INSTANCE_STATUS_RUNNING:
      return "running";
    case supervisor::core::v1::INSTANCE_STATUS_COMPLETED:
      return "completed";
    case supervisor::core::v1::INSTANCE_STATUS_FAILED:
      return "failed";
    case supervisor::core::v1::INSTANCE_STATUS_TERMINATED:
      return "terminated";
    default:
      return "unspecified";
  }
}

} // namespace supervisor::model
