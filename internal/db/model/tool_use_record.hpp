#pragma once

#include <cstdint>
#include <string>

namespace supervisor::db::model {

// Projection of a tool_use transcript entry.
struct ToolUseRecord {
  std::string entry_id;
  std::string execution_id;
  uint64_t    sequence = 0;

  std::string tool;
  std::string input_summary;
  bool        is_error    = false;
  bool        is_blocked  = false;
  uint64_t    duration_ms = 0;
  std::string error_message;
};

} // namespace supervisor::db::model
