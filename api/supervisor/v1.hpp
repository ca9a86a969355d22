#pragma once

#include "supervisor/core/v1/types.pb.h"
#include "supervisor/core/v1/instance.pb.h"
#include "supervisor/core/v1/transcript.pb.h"

#include "supervisor/services/v1/supervisor_registry_service.pb.h"
#include "supervisor/services/v1/supervisor_telemetry_service.pb.h"
#include "supervisor/services/v1/supervisor_query_service.pb.h"

namespace supervisor::v1 {
using namespace ::supervisor::core::v1;
using namespace ::supervisor::services::v1;
}
