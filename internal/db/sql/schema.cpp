#include "internal/db/sql/schema.hpp"

namespace supervisor::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS agent_instances (instance_id TEXT PRIMARY KEY, task_id TEXT NOT NULL, task_list_id TEXT NOT NULL, "
      "status INTEGER NOT NULL, pid TEXT NOT NULL DEFAULT '', hostname TEXT NOT NULL DEFAULT '', started_at_ms INTEGER NOT NULL, "
      "last_heartbeat_at_ms INTEGER NOT NULL DEFAULT 0, heartbeat_count INTEGER NOT NULL DEFAULT 0, termination_reason TEXT NOT NULL DEFAULT '', "
      "terminated_at_ms INTEGER NOT NULL DEFAULT 0, version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_agent_instances_status ON agent_instances(status, last_heartbeat_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_agent_instances_task ON agent_instances(task_id, task_list_id);",
      "CREATE TABLE IF NOT EXISTS executions (execution_id TEXT PRIMARY KEY, instance_id TEXT NOT NULL UNIQUE REFERENCES agent_instances(instance_id), "
      "task_id TEXT NOT NULL, started_at_ms INTEGER NOT NULL, completed_at_ms INTEGER NOT NULL DEFAULT 0, outcome TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS transcript_entries (entry_id TEXT PRIMARY KEY, execution_id TEXT NOT NULL REFERENCES executions(execution_id), "
      "instance_id TEXT NOT NULL, task_id TEXT NOT NULL, sequence INTEGER NOT NULL, entry_type INTEGER NOT NULL, category TEXT NOT NULL, "
      "summary TEXT NOT NULL, payload TEXT NOT NULL, committed_at_ms INTEGER NOT NULL, UNIQUE(execution_id, sequence));",
      "CREATE TABLE IF NOT EXISTS tool_uses (entry_id TEXT PRIMARY KEY REFERENCES transcript_entries(entry_id), execution_id TEXT NOT NULL, "
      "sequence INTEGER NOT NULL, tool TEXT NOT NULL, input_summary TEXT NOT NULL, is_error INTEGER NOT NULL, is_blocked INTEGER NOT NULL, "
      "duration_ms INTEGER NOT NULL, error_message TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_tool_uses_execution ON tool_uses(execution_id, sequence);",
      "CREATE TABLE IF NOT EXISTS assertion_results (entry_id TEXT PRIMARY KEY REFERENCES transcript_entries(entry_id), execution_id TEXT NOT NULL, "
      "sequence INTEGER NOT NULL, assertion_id TEXT NOT NULL, category TEXT NOT NULL, result INTEGER NOT NULL, message TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_assertion_results_execution ON assertion_results(execution_id, sequence);",
      "ALTER TABLE assertion_results ADD COLUMN chain_id TEXT NOT NULL DEFAULT '';",
      "ALTER TABLE assertion_results ADD COLUMN chain_position INTEGER NOT NULL DEFAULT 0;",
      "CREATE INDEX IF NOT EXISTS idx_assertion_results_chain ON assertion_results(chain_id, chain_position);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS agent_instances (instance_id TEXT PRIMARY KEY, task_id TEXT NOT NULL, task_list_id TEXT NOT NULL, "
      "status SMALLINT NOT NULL, pid TEXT NOT NULL DEFAULT '', hostname TEXT NOT NULL DEFAULT '', started_at_ms BIGINT NOT NULL, "
      "last_heartbeat_at_ms BIGINT NOT NULL DEFAULT 0, heartbeat_count BIGINT NOT NULL DEFAULT 0, termination_reason TEXT NOT NULL DEFAULT '', "
      "terminated_at_ms BIGINT NOT NULL DEFAULT 0, version BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_agent_instances_status ON agent_instances(status, last_heartbeat_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_agent_instances_task ON agent_instances(task_id, task_list_id);",
      "CREATE TABLE IF NOT EXISTS executions (execution_id TEXT PRIMARY KEY, instance_id TEXT NOT NULL UNIQUE REFERENCES agent_instances(instance_id), "
      "task_id TEXT NOT NULL, started_at_ms BIGINT NOT NULL, completed_at_ms BIGINT NOT NULL DEFAULT 0, outcome TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS transcript_entries (entry_id TEXT PRIMARY KEY, execution_id TEXT NOT NULL REFERENCES executions(execution_id), "
      "instance_id TEXT NOT NULL, task_id TEXT NOT NULL, sequence BIGINT NOT NULL, entry_type SMALLINT NOT NULL, category TEXT NOT NULL, "
      "summary TEXT NOT NULL, payload JSONB NOT NULL, committed_at_ms BIGINT NOT NULL, UNIQUE(execution_id, sequence));",
      "CREATE TABLE IF NOT EXISTS tool_uses (entry_id TEXT PRIMARY KEY REFERENCES transcript_entries(entry_id), execution_id TEXT NOT NULL, "
      "sequence BIGINT NOT NULL, tool TEXT NOT NULL, input_summary TEXT NOT NULL, is_error BOOLEAN NOT NULL, is_blocked BOOLEAN NOT NULL, "
      "duration_ms BIGINT NOT NULL, error_message TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_tool_uses_execution ON tool_uses(execution_id, sequence);",
      "CREATE TABLE IF NOT EXISTS assertion_results (entry_id TEXT PRIMARY KEY REFERENCES transcript_entries(entry_id), execution_id TEXT NOT NULL, "
      "sequence BIGINT NOT NULL, assertion_id TEXT NOT NULL, category TEXT NOT NULL, result SMALLINT NOT NULL, message TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_assertion_results_execution ON assertion_results(execution_id, sequence);",
      "ALTER TABLE assertion_results ADD COLUMN chain_id TEXT NOT NULL DEFAULT '';",
      "ALTER TABLE assertion_results ADD COLUMN chain_position INTEGER NOT NULL DEFAULT 0;",
      "CREATE INDEX IF NOT EXISTS idx_assertion_results_chain ON assertion_results(chain_id, chain_position);",
  };
  return kSchema;
}

} // namespace supervisor::db::sql
