#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "supervisor/v1.hpp"

namespace supervisor::db::sqlite {

using supervisor::db::ErrorCode;
using supervisor::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
    if (rc != SQLITE_OK) {
        SqliteDB::Throw(db, rc, "sqlite prepare");
    }
    return StmtPtr(st, &sqlite3_finalize);
}

// Steps a read statement; SQLITE_ROW/SQLITE_DONE pass, anything else throws.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    SqliteDB::Throw(db, rc, "sqlite step");
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

constexpr const char* kInstanceColumns =
    "instance_id,task_id,task_list_id,status,pid,hostname,started_at_ms,last_heartbeat_at_ms,"
    "heartbeat_count,termination_reason,terminated_at_ms,version";

model::InstanceRecord ReadInstance(sqlite3_stmt* st) {
    model::InstanceRecord r;
    r.instance_id = ColText(st, 0);
    r.task_id = ColText(st, 1);
    r.task_list_id = ColText(st, 2);
    r.status = static_cast<supervisor::v1::InstanceStatus>(ColI32(st, 3));
    r.pid = ColText(st, 4);
    r.hostname = ColText(st, 5);
    r.started_at_ms = ColU64(st, 6);
    r.last_heartbeat_at_ms = ColU64(st, 7);
    r.heartbeat_count = ColU64(st, 8);
    r.termination_reason = ColText(st, 9);
    r.terminated_at_ms = ColU64(st, 10);
    r.version = ColU64(st, 11);
    return r;
}

constexpr const char* kExecutionColumns = "execution_id,instance_id,task_id,started_at_ms,completed_at_ms,outcome";

model::ExecutionRecord ReadExecution(sqlite3_stmt* st) {
    model::ExecutionRecord r;
    r.execution_id = ColText(st, 0);
    r.instance_id = ColText(st, 1);
    r.task_id = ColText(st, 2);
    r.started_at_ms = ColU64(st, 3);
    r.completed_at_ms = ColU64(st, 4);
    r.outcome = ColText(st, 5);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result SqliteRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO agent_instances(") + kInstanceColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";
    auto st = Prepare(db, sql);

    BindText(st.get(), 1, r.instance_id);
    BindText(st.get(), 2, r.task_id);
    BindText(st.get(), 3, r.task_list_id);
    BindI32(st.get(), 4, static_cast<int>(r.status));
    BindText(st.get(), 5, r.pid);
    BindText(st.get(), 6, r.hostname);
    BindU64(st.get(), 7, r.started_at_ms);
    BindU64(st.get(), 8, r.last_heartbeat_at_ms);
    BindU64(st.get(), 9, r.heartbeat_count);
    BindText(st.get(), 10, r.termination_reason);
    BindU64(st.get(), 11, r.terminated_at_ms);
    BindU64(st.get(), 12, r.version);

    int rc = sqlite3_step(st.get());
    if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
        return Result::Err(ErrorCode::AlreadyExists, "instance " + r.instance_id);
    }
    return Translate(db, rc);
}

std::optional<model::InstanceRecord>
SqliteRepository::GetInstance(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, std::string("SELECT ") + kInstanceColumns + " FROM agent_instances WHERE instance_id=?;");
    BindText(st.get(), 1, id);

    if (!StepRow(db, st.get())) {
        return std::nullopt;
    }
    return ReadInstance(st.get());
}

std::vector<model::InstanceRecord>
SqliteRepository::ListInstances(Transaction& t, const InstanceFilter& filter) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kInstanceColumns + " FROM agent_instances WHERE 1=1";
    if (!filter.task_id.empty()) sql += " AND task_id=?";
    if (!filter.task_list_id.empty()) sql += " AND task_list_id=?";
    if (!filter.statuses.empty()) {
        sql += " AND status IN (";
        for (size_t i = 0; i < filter.statuses.size(); ++i) {
            sql += i == 0 ? "?" : ",?";
        }
        sql += ")";
    }
    if (filter.heartbeat_before_ms.has_value()) sql += " AND last_heartbeat_at_ms<?";
    sql += " ORDER BY started_at_ms ASC, instance_id ASC;";

    auto st = Prepare(db, sql);

    int bind_idx = 1;
    if (!filter.task_id.empty()) BindText(st.get(), bind_idx++, filter.task_id);
    if (!filter.task_list_id.empty()) BindText(st.get(), bind_idx++, filter.task_list_id);
    for (auto status : filter.statuses) {
        BindI32(st.get(), bind_idx++, static_cast<int>(status));
    }
    if (filter.heartbeat_before_ms.has_value()) BindU64(st.get(), bind_idx++, *filter.heartbeat_before_ms);

    std::vector<model::InstanceRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadInstance(st.get()));
    }
    return out;
}

Result SqliteRepository::UpdateInstance(Transaction& t, model::InstanceRecord& r, uint64_t expected_version) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE agent_instances SET status=?,pid=?,hostname=?,last_heartbeat_at_ms=?,heartbeat_count=?,"
        "termination_reason=?,terminated_at_ms=?,version=? WHERE instance_id=? AND version=?;";

    auto st = Prepare(db, sql);

    BindI32(st.get(), 1, static_cast<int>(r.status));
    BindText(st.get(), 2, r.pid);
    BindText(st.get(), 3, r.hostname);
    BindU64(st.get(), 4, r.last_heartbeat_at_ms);
    BindU64(st.get(), 5, r.heartbeat_count);
    BindText(st.get(), 6, r.termination_reason);
    BindU64(st.get(), 7, r.terminated_at_ms);
    BindU64(st.get(), 8, expected_version + 1);
    BindText(st.get(), 9, r.instance_id);
    BindU64(st.get(), 10, expected_version);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        return Translate(db, rc);
    }

    if (sqlite3_changes(db) == 0) {
        st.reset();
        return GetInstance(t, r.instance_id).has_value()
                   ? Result::Err(ErrorCode::Conflict, "instance " + r.instance_id + " version moved")
                   : Result::Err(ErrorCode::NotFound, "instance " + r.instance_id);
    }

    r.version = expected_version + 1;
    return Result::Ok();
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result SqliteRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, std::string("INSERT INTO executions(") + kExecutionColumns + ") VALUES(?,?,?,?,?,?);");

    BindText(st.get(), 1, r.execution_id);
    BindText(st.get(), 2, r.instance_id);
    BindText(st.get(), 3, r.task_id);
    BindU64(st.get(), 4, r.started_at_ms);
    BindU64(st.get(), 5, r.completed_at_ms);
    BindText(st.get(), 6, r.outcome);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ExecutionRecord>
SqliteRepository::GetExecution(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, std::string("SELECT ") + kExecutionColumns + " FROM executions WHERE execution_id=?;");
    BindText(st.get(), 1, id);

    if (!StepRow(db, st.get())) {
        return std::nullopt;
    }
    return ReadExecution(st.get());
}

std::optional<model::ExecutionRecord>
SqliteRepository::GetExecutionByInstance(Transaction& t, const std::string& instance_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, std::string("SELECT ") + kExecutionColumns + " FROM executions WHERE instance_id=?;");
    BindText(st.get(), 1, instance_id);

    if (!StepRow(db, st.get())) {
        return std::nullopt;
    }
    return ReadExecution(st.get());
}

Result SqliteRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "UPDATE executions SET completed_at_ms=?,outcome=? WHERE execution_id=?;");
    BindU64(st.get(), 1, r.completed_at_ms);
    BindText(st.get(), 2, r.outcome);
    BindText(st.get(), 3, r.execution_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        return Translate(db, rc);
    }
    if (sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "execution " + r.execution_id);
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Transcript
// ------------------------------------------------------------------

Result SqliteRepository::AppendTranscriptEntry(Transaction& t, model::TranscriptEntryRecord& e) {
    auto* db = TX(t).Handle();

    if (!GetExecution(t, e.execution_id).has_value()) {
        return Result::Err(ErrorCode::NotFound, "execution " + e.execution_id);
    }
    e.sequence = GetMaxSequence(t, e.execution_id) + 1;

    const char* sql =
        "INSERT INTO transcript_entries(entry_id,execution_id,instance_id,task_id,sequence,entry_type,category,summary,payload,committed_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?,?,?);";

    auto st = Prepare(db, sql);

    BindText(st.get(), 1, e.entry_id);
    BindText(st.get(), 2, e.execution_id);
    BindText(st.get(), 3, e.instance_id);
    BindText(st.get(), 4, e.task_id);
    BindU64(st.get(), 5, e.sequence);
    BindI32(st.get(), 6, static_cast<int>(e.entry_type));
    BindText(st.get(), 7, e.category);
    BindText(st.get(), 8, e.summary);
    BindText(st.get(), 9, e.payload_json);
    BindU64(st.get(), 10, e.committed_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::TranscriptEntryRecord> SqliteRepository::ReadTranscript(
    Transaction& t, const std::string& execution_id, uint64_t from_sequence,
    std::optional<uint64_t> max_entries) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT entry_id,execution_id,instance_id,task_id,sequence,entry_type,category,summary,payload,committed_at_ms "
        "FROM transcript_entries WHERE execution_id=? AND sequence>=? ORDER BY sequence ASC";
    if (max_entries.has_value()) {
        sql += " LIMIT ?";
    }
    sql += ";";

    auto st = Prepare(db, sql);

    BindText(st.get(), 1, execution_id);
    BindU64(st.get(), 2, from_sequence);
    if (max_entries.has_value()) {
        BindU64(st.get(), 3, *max_entries);
    }

    std::vector<model::TranscriptEntryRecord> out;
    while (StepRow(db, st.get())) {
        model::TranscriptEntryRecord e;
        e.entry_id = ColText(st.get(), 0);
        e.execution_id = ColText(st.get(), 1);
        e.instance_id = ColText(st.get(), 2);
        e.task_id = ColText(st.get(), 3);
        e.sequence = ColU64(st.get(), 4);
        e.entry_type = static_cast<supervisor::v1::EntryType>(ColI32(st.get(), 5));
        e.category = ColText(st.get(), 6);
        e.summary = ColText(st.get(), 7);
        e.payload_json = ColText(st.get(), 8);
        e.committed_at_ms = ColU64(st.get(), 9);
        out.push_back(std::move(e));
    }
    return out;
}

uint64_t SqliteRepository::GetMaxSequence(Transaction& t, const std::string& execution_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT COALESCE(MAX(sequence), 0) FROM transcript_entries WHERE execution_id=?;");
    BindText(st.get(), 1, execution_id);

    if (!StepRow(db, st.get())) {
        return 0;
    }
    return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Projections
// ------------------------------------------------------------------

Result SqliteRepository::InsertToolUse(Transaction& t, const model::ToolUseRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO tool_uses(entry_id,execution_id,sequence,tool,input_summary,is_error,is_blocked,duration_ms,error_message) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    auto st = Prepare(db, sql);

    BindText(st.get(), 1, r.entry_id);
    BindText(st.get(), 2, r.execution_id);
    BindU64(st.get(), 3, r.sequence);
    BindText(st.get(), 4, r.tool);
    BindText(st.get(), 5, r.input_summary);
    BindI32(st.get(), 6, r.is_error ? 1 : 0);
    BindI32(st.get(), 7, r.is_blocked ? 1 : 0);
    BindU64(st.get(), 8, r.duration_ms);
    BindText(st.get(), 9, r.error_message);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ToolUseRecord>
SqliteRepository::ListToolUses(Transaction& t, const std::string& execution_id, bool errors_only) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT entry_id,execution_id,sequence,tool,input_summary,is_error,is_blocked,duration_ms,error_message "
        "FROM tool_uses WHERE execution_id=?";
    if (errors_only) {
        sql += " AND is_error=1";
    }
    sql += " ORDER BY sequence ASC;";

    auto st = Prepare(db, sql);
    BindText(st.get(), 1, execution_id);

    std::vector<model::ToolUseRecord> out;
    while (StepRow(db, st.get())) {
        model::ToolUseRecord r;
        r.entry_id = ColText(st.get(), 0);
        r.execution_id = ColText(st.get(), 1);
        r.sequence = ColU64(st.get(), 2);
        r.tool = ColText(st.get(), 3);
        r.input_summary = ColText(st.get(), 4);
        r.is_error = ColI32(st.get(), 5) != 0;
        r.is_blocked = ColI32(st.get(), 6) != 0;
        r.duration_ms = ColU64(st.get(), 7);
        r.error_message = ColText(st.get(), 8);
        out.push_back(std::move(r));
    }
    return out;
}

Result SqliteRepository::InsertAssertionResult(Transaction& t, const model::AssertionResultRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO assertion_results(entry_id,execution_id,sequence,assertion_id,category,result,message,chain_id,chain_position) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    auto st = Prepare(db, sql);

    BindText(st.get(), 1, r.entry_id);
    BindText(st.get(), 2, r.execution_id);
    BindU64(st.get(), 3, r.sequence);
    BindText(st.get(), 4, r.assertion_id);
    BindText(st.get(), 5, r.category);
    BindI32(st.get(), 6, static_cast<int>(r.result));
    BindText(st.get(), 7, r.message);
    BindText(st.get(), 8, r.chain_id);
    BindI32(st.get(), 9, static_cast<int>(r.chain_position));

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::AssertionResultRecord>
SqliteRepository::ListAssertionResults(Transaction& t, const std::string& execution_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
                      "SELECT entry_id,execution_id,sequence,assertion_id,category,result,message,chain_id,chain_position "
                      "FROM assertion_results WHERE execution_id=? ORDER BY sequence ASC;");
    BindText(st.get(), 1, execution_id);

    std::vector<model::AssertionResultRecord> out;
    while (StepRow(db, st.get())) {
        model::AssertionResultRecord r;
        r.entry_id = ColText(st.get(), 0);
        r.execution_id = ColText(st.get(), 1);
        r.sequence = ColU64(st.get(), 2);
        r.assertion_id = ColText(st.get(), 3);
        r.category = ColText(st.get(), 4);
        r.result = static_cast<supervisor::v1::AssertionOutcome>(ColI32(st.get(), 5));
        r.message = ColText(st.get(), 6);
        r.chain_id = ColText(st.get(), 7);
        r.chain_position = static_cast<uint32_t>(ColI32(st.get(), 8));
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace supervisor::db::sqlite
