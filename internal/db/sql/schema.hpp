#pragma once

#include <string>
#include <vector>

namespace supervisor::db::sql {

/*
  Persisted layout, one statement per entry.

  agent_instances     registry rows (status + heartbeat recency)
  executions          one per instance
  transcript_entries  append-only, UNIQUE(execution_id, sequence)
  tool_uses           projection of tool_use entries
  assertion_results   projection of assertion entries

  Timestamps are unix milliseconds, 0 = unset.
*/

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace supervisor::db::sql
