#include "pg_repository.hpp"

#include "internal/util/errors.hpp"
#include "supervisor/v1.hpp"

namespace supervisor::db::postgres {

namespace {

constexpr const char* kInstanceColumns =
    "instance_id,task_id,task_list_id,status,pid,hostname,started_at_ms,last_heartbeat_at_ms,"
    "heartbeat_count,termination_reason,terminated_at_ms,version";

constexpr const char* kExecutionColumns = "execution_id,instance_id,task_id,started_at_ms,completed_at_ms,outcome";

model::InstanceRecord ReadInstance(const pqxx::row& row) {
  model::InstanceRecord r;
  r.instance_id          = row[0].c_str();
  r.task_id              = row[1].c_str();
  r.task_list_id         = row[2].c_str();
  r.status               = (supervisor::v1::InstanceStatus)row[3].as<int>();
  r.pid                  = row[4].c_str();
  r.hostname             = row[5].c_str();
  r.started_at_ms        = row[6].as<uint64_t>();
  r.last_heartbeat_at_ms = row[7].as<uint64_t>();
  r.heartbeat_count      = row[8].as<uint64_t>();
  r.termination_reason   = row[9].c_str();
  r.terminated_at_ms     = row[10].as<uint64_t>();
  r.version              = row[11].as<uint64_t>();
  return r;
}

model::ExecutionRecord ReadExecution(const pqxx::row& row) {
  model::ExecutionRecord r;
  r.execution_id    = row[0].c_str();
  r.instance_id     = row[1].c_str();
  r.task_id         = row[2].c_str();
  r.started_at_ms   = row[3].as<uint64_t>();
  r.completed_at_ms = row[4].as<uint64_t>();
  r.outcome         = row[5].c_str();
  return r;
}

// Reads surface transient driver failures as StoreUnavailable.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::broken_connection& e) {
    throw supervisor::util::StoreUnavailable(std::string("postgres: ") + e.what());
  } catch (const pqxx::query_canceled& e) {
    throw supervisor::util::StoreUnavailable(std::string("postgres: ") + e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw supervisor::util::StoreUnavailable(std::string("postgres: ") + e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::query_canceled*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result PgRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO agent_instances(") + kInstanceColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12);",
                             r.instance_id, r.task_id, r.task_list_id, (int)r.status, r.pid, r.hostname, r.started_at_ms,
                             r.last_heartbeat_at_ms, r.heartbeat_count, r.termination_reason, r.terminated_at_ms, r.version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::InstanceRecord> PgRepository::GetInstance(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::InstanceRecord> {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kInstanceColumns + " FROM agent_instances WHERE instance_id=$1;", id);
    if (res.empty()) return std::nullopt;
    return ReadInstance(res[0]);
  });
}

std::vector<model::InstanceRecord> PgRepository::ListInstances(Transaction& t, const InstanceFilter& filter) {
  return Read([&] {
    std::string        sql = std::string("SELECT ") + kInstanceColumns + " FROM agent_instances WHERE 1=1";
    pqxx::params       params;
    int                idx = 1;

    if (!filter.task_id.empty()) {
      sql += " AND task_id=$" + std::to_string(idx++);
      params.append(filter.task_id);
    }
    if (!filter.task_list_id.empty()) {
      sql += " AND task_list_id=$" + std::to_string(idx++);
      params.append(filter.task_list_id);
    }
    if (!filter.statuses.empty()) {
      sql += " AND status IN (";
      for (size_t i = 0; i < filter.statuses.size(); ++i) {
        sql += (i == 0 ? "$" : ",$") + std::to_string(idx++);
        params.append(static_cast<int>(filter.statuses[i]));
      }
      sql += ")";
    }
    if (filter.heartbeat_before_ms.has_value()) {
      sql += " AND last_heartbeat_at_ms<$" + std::to_string(idx++);
      params.append(*filter.heartbeat_before_ms);
    }
    sql += " ORDER BY started_at_ms ASC, instance_id ASC;";

    auto res = TX(t).Work().exec_params(sql, params);

    std::vector<model::InstanceRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadInstance(row));
    }
    return out;
  });
}

Result PgRepository::UpdateInstance(Transaction& t, model::InstanceRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE agent_instances SET status=$3,pid=$4,hostname=$5,last_heartbeat_at_ms=$6,heartbeat_count=$7,"
        "termination_reason=$8,terminated_at_ms=$9,version=$10 WHERE instance_id=$1 AND version=$2;",
        r.instance_id, expected_version, (int)r.status, r.pid, r.hostname, r.last_heartbeat_at_ms, r.heartbeat_count,
        r.termination_reason, r.terminated_at_ms, expected_version + 1);

    if (res.affected_rows() == 0) {
      return GetInstance(t, r.instance_id).has_value() ? Result::Err(ErrorCode::Conflict, "instance " + r.instance_id + " version moved")
                                                       : Result::Err(ErrorCode::NotFound, "instance " + r.instance_id);
    }
    r.version = expected_version + 1;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result PgRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO executions(") + kExecutionColumns + ") VALUES($1,$2,$3,$4,$5,$6);", r.execution_id,
                             r.instance_id, r.task_id, r.started_at_ms, r.completed_at_ms, r.outcome);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ExecutionRecord> PgRepository::GetExecution(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::ExecutionRecord> {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kExecutionColumns + " FROM executions WHERE execution_id=$1;", id);
    if (res.empty()) return std::nullopt;
    return ReadExecution(res[0]);
  });
}

std::optional<model::ExecutionRecord> PgRepository::GetExecutionByInstance(Transaction& t, const std::string& instance_id) {
  return Read([&]() -> std::optional<model::ExecutionRecord> {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kExecutionColumns + " FROM executions WHERE instance_id=$1;", instance_id);
    if (res.empty()) return std::nullopt;
    return ReadExecution(res[0]);
  });
}

Result PgRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE executions SET completed_at_ms=$2,outcome=$3 WHERE execution_id=$1;", r.execution_id,
                                        r.completed_at_ms, r.outcome);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "execution " + r.execution_id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Transcript
// ------------------------------------------------------------------

Result PgRepository::AppendTranscriptEntry(Transaction& t, model::TranscriptEntryRecord& e) {
  try {
    if (!GetExecution(t, e.execution_id).has_value()) {
      return Result::Err(ErrorCode::NotFound, "execution " + e.execution_id);
    }
    e.sequence = GetMaxSequence(t, e.execution_id) + 1;

    TX(t).Work().exec_params(
        "INSERT INTO transcript_entries(entry_id,execution_id,instance_id,task_id,sequence,entry_type,category,summary,payload,committed_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9::jsonb,$10);",
        e.entry_id, e.execution_id, e.instance_id, e.task_id, e.sequence, (int)e.entry_type, e.category, e.summary, e.payload_json,
        e.committed_at_ms);
    return Result::Ok();
  } catch (const supervisor::util::StoreUnavailable& e) {
    return Result::Err(ErrorCode::Busy, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TranscriptEntryRecord> PgRepository::ReadTranscript(Transaction& t, const std::string& execution_id, uint64_t from_sequence,
                                                                       std::optional<uint64_t> max_entries) {
  return Read([&] {
    std::string sql =
        "SELECT entry_id,execution_id,instance_id,task_id,sequence,entry_type,category,summary,payload::text,committed_at_ms "
        "FROM transcript_entries WHERE execution_id=$1 AND sequence>=$2 ORDER BY sequence ASC";
    if (max_entries.has_value()) {
      sql += " LIMIT " + std::to_string(*max_entries);
    }
    sql += ";";

    auto res = TX(t).Work().exec_params(sql, execution_id, from_sequence);

    std::vector<model::TranscriptEntryRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::TranscriptEntryRecord e;
      e.entry_id        = row[0].c_str();
      e.execution_id    = row[1].c_str();
      e.instance_id     = row[2].c_str();
      e.task_id         = row[3].c_str();
      e.sequence        = row[4].as<uint64_t>();
      e.entry_type      = (supervisor::v1::EntryType)row[5].as<int>();
      e.category        = row[6].c_str();
      e.summary         = row[7].c_str();
      e.payload_json    = row[8].c_str();
      e.committed_at_ms = row[9].as<uint64_t>();
      out.push_back(std::move(e));
    }
    return out;
  });
}

uint64_t PgRepository::GetMaxSequence(Transaction& t, const std::string& execution_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_params("SELECT COALESCE(MAX(sequence), 0) FROM transcript_entries WHERE execution_id=$1;", execution_id);
    if (res.empty()) {
      return uint64_t{0};
    }
    return res[0][0].as<uint64_t>();
  });
}

// ------------------------------------------------------------------
// Projections
// ------------------------------------------------------------------

Result PgRepository::InsertToolUse(Transaction& t, const model::ToolUseRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tool_uses(entry_id,execution_id,sequence,tool,input_summary,is_error,is_blocked,duration_ms,error_message) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9);",
        r.entry_id, r.execution_id, r.sequence, r.tool, r.input_summary, r.is_error, r.is_blocked, r.duration_ms, r.error_message);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ToolUseRecord> PgRepository::ListToolUses(Transaction& t, const std::string& execution_id, bool errors_only) {
  return Read([&] {
    std::string sql =
        "SELECT entry_id,execution_id,sequence,tool,input_summary,is_error,is_blocked,duration_ms,error_message "
        "FROM tool_uses WHERE execution_id=$1";
    if (errors_only) {
      sql += " AND is_error";
    }
    sql += " ORDER BY sequence ASC;";

    auto res = TX(t).Work().exec_params(sql, execution_id);

    std::vector<model::ToolUseRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::ToolUseRecord r;
      r.entry_id      = row[0].c_str();
      r.execution_id  = row[1].c_str();
      r.sequence      = row[2].as<uint64_t>();
      r.tool          = row[3].c_str();
      r.input_summary = row[4].c_str();
      r.is_error      = row[5].as<bool>();
      r.is_blocked    = row[6].as<bool>();
      r.duration_ms   = row[7].as<uint64_t>();
      r.error_message = row[8].c_str();
      out.push_back(std::move(r));
    }
    return out;
  });
}

Result PgRepository::InsertAssertionResult(Transaction& t, const model::AssertionResultRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO assertion_results(entry_id,execution_id,sequence,assertion_id,category,result,message,chain_id,chain_position) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9);",
        r.entry_id, r.execution_id, r.sequence, r.assertion_id, r.category, (int)r.result, r.message, r.chain_id, (int)r.chain_position);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AssertionResultRecord> PgRepository::ListAssertionResults(Transaction& t, const std::string& execution_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(
        "SELECT entry_id,execution_id,sequence,assertion_id,category,result,message,chain_id,chain_position "
        "FROM assertion_results WHERE execution_id=$1 ORDER BY sequence ASC;",
        execution_id);

    std::vector<model::AssertionResultRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::AssertionResultRecord r;
      r.entry_id     = row[0].c_str();
      r.execution_id = row[1].c_str();
      r.sequence     = row[2].as<uint64_t>();
      r.assertion_id = row[3].c_str();
      r.category     = row[4].c_str();
      r.result       = (supervisor::v1::AssertionOutcome)row[5].as<int>();
      r.message      = row[6].c_str();
      r.chain_id       = row[7].c_str();
      r.chain_position = (uint32_t)row[8].as<int>();
      out.push_back(std::move(r));
    }
    return out;
  });
}

} // namespace supervisor::db::postgres
