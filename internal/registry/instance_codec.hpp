#pragma once

#include "internal/db/model/execution_record.hpp"
#include "internal/db/model/instance_record.hpp"
#include "supervisor/core/v1/instance.pb.h"

namespace supervisor::registry {

supervisor::core::v1::AgentInstance ToProto(const supervisor::db::model::InstanceRecord& record);
supervisor::core::v1::Execution     ToProto(const supervisor::db::model::ExecutionRecord& record);

} // namespace supervisor::registry
