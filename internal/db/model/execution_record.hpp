#pragma once

#include <cstdint>
#include <string>

namespace supervisor::db::model {

// One task attempt. Exactly one per instance, created with it.
struct ExecutionRecord {
  std::string execution_id;
  std::string instance_id;
  std::string task_id;

  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0; // 0 = still open

  // empty until the owning instance reaches a terminal status
  std::string outcome;
};

} // namespace supervisor::db::model
