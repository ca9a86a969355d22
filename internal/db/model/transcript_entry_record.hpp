#pragma once

#include <cstdint>
#include <string>

#include "supervisor/core/v1/types.pb.h"

namespace supervisor::db::model {

/*
  Append-only transcript row.

  sequence is assigned by the store on append (1 + current max for the
  execution) and never by the caller.
*/

struct TranscriptEntryRecord {
  std::string entry_id;
  std::string execution_id;
  std::string instance_id;
  std::string task_id;

  uint64_t sequence = 0;

  supervisor::core::v1::EntryType entry_type = supervisor::core::v1::ENTRY_TYPE_UNSPECIFIED;

  std::string category;
  std::string summary;
  std::string payload_json; // JSON object text, "{}" when empty

  uint64_t committed_at_ms = 0;
};

} // namespace supervisor::db::model
