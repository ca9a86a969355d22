#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"

#if SUPERVISOR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SUPERVISOR_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using supervisor::core::v1::ASSERTION_OUTCOME_FAIL;
using supervisor::core::v1::ASSERTION_OUTCOME_PASS;
using supervisor::core::v1::ENTRY_TYPE_ASSERTION;
using supervisor::core::v1::ENTRY_TYPE_LIFECYCLE;
using supervisor::core::v1::ENTRY_TYPE_TOOL_USE;
using supervisor::core::v1::INSTANCE_STATUS_COMPLETED;
using supervisor::core::v1::INSTANCE_STATUS_PENDING;
using supervisor::core::v1::INSTANCE_STATUS_RUNNING;
using supervisor::db::ErrorCode;
using supervisor::db::InstanceFilter;
using supervisor::db::Repository;
using supervisor::db::memory::MemoryRepository;
using supervisor::db::model::AssertionResultRecord;
using supervisor::db::model::ExecutionRecord;
using supervisor::db::model::InstanceRecord;
using supervisor::db::model::ToolUseRecord;
using supervisor::db::model::TranscriptEntryRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

InstanceRecord MakeInstance(const std::string& id, const std::string& task_id, uint64_t started_at_ms) {
  InstanceRecord r;
  r.instance_id   = id;
  r.task_id       = task_id;
  r.task_list_id  = "list-" + task_id;
  r.status        = INSTANCE_STATUS_PENDING;
  r.started_at_ms = started_at_ms;
  r.version       = 1;
  return r;
}

ExecutionRecord MakeExecution(const std::string& execution_id, const InstanceRecord& instance) {
  ExecutionRecord e;
  e.execution_id  = execution_id;
  e.instance_id   = instance.instance_id;
  e.task_id       = instance.task_id;
  e.started_at_ms = instance.started_at_ms;
  return e;
}

TranscriptEntryRecord MakeEntry(const std::string& entry_id, const ExecutionRecord& execution, supervisor::core::v1::EntryType type) {
  TranscriptEntryRecord e;
  e.entry_id        = entry_id;
  e.execution_id    = execution.execution_id;
  e.instance_id     = execution.instance_id;
  e.task_id         = execution.task_id;
  e.entry_type      = type;
  e.category        = "test";
  e.summary         = entry_id;
  e.payload_json    = R"({"k":"v"})";
  e.committed_at_ms = NowMs();
  return e;
}

void VerifyInstanceCompareAndSwap(Repository& repo, const std::string& id) {
  auto seed = MakeInstance(id, id + "-task", 1000);
  {
    auto tx = repo.Begin();
    assert(repo.InsertInstance(*tx, seed));
    tx->Commit();
  }

  {
    // a failed statement poisons a postgres transaction, so isolate it
    auto tx  = repo.Begin();
    auto dup = repo.InsertInstance(*tx, seed);
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx = repo.Begin();

  auto current = repo.GetInstance(*tx, id);
  assert(current.has_value());
  assert(current->status == INSTANCE_STATUS_PENDING);
  assert(current->version == 1);

  current->status               = INSTANCE_STATUS_RUNNING;
  current->last_heartbeat_at_ms = 1500;
  current->heartbeat_count      = 1;
  assert(repo.UpdateInstance(*tx, *current, 1));
  assert(current->version == 2);

  // stale expected version loses
  auto stale   = *current;
  stale.status = INSTANCE_STATUS_COMPLETED;
  auto lost    = repo.UpdateInstance(*tx, stale, 1);
  assert(lost.code == ErrorCode::Conflict);

  auto missing = MakeInstance(id + "-missing", "t", 1);
  auto absent  = repo.UpdateInstance(*tx, missing, 1);
  assert(absent.code == ErrorCode::NotFound);

  auto read = repo.GetInstance(*tx, id);
  assert(read.has_value());
  assert(read->status == INSTANCE_STATUS_RUNNING);
  assert(read->last_heartbeat_at_ms == 1500);
  assert(read->heartbeat_count == 1);
  assert(read->version == 2);

  tx->Commit();
}

void VerifyInstanceListing(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  auto a = MakeInstance(prefix + "-a", prefix + "-task", 3000);
  auto b = MakeInstance(prefix + "-b", prefix + "-task", 2000);
  auto c = MakeInstance(prefix + "-c", prefix + "-other", 1000);
  assert(repo.InsertInstance(*tx, a));
  assert(repo.InsertInstance(*tx, b));
  assert(repo.InsertInstance(*tx, c));

  b.status               = INSTANCE_STATUS_RUNNING;
  b.last_heartbeat_at_ms = 2500;
  assert(repo.UpdateInstance(*tx, b, 1));

  InstanceFilter by_task;
  by_task.task_id = prefix + "-task";
  auto listed     = repo.ListInstances(*tx, by_task);
  assert(listed.size() == 2);
  // ordered by started_at
  assert(listed[0].instance_id == b.instance_id);
  assert(listed[1].instance_id == a.instance_id);

  InstanceFilter running;
  running.task_id  = prefix + "-task";
  running.statuses = {INSTANCE_STATUS_RUNNING};
  auto only        = repo.ListInstances(*tx, running);
  assert(only.size() == 1);
  assert(only[0].instance_id == b.instance_id);

  InstanceFilter silent;
  silent.statuses            = {INSTANCE_STATUS_RUNNING};
  silent.task_id             = prefix + "-task";
  silent.heartbeat_before_ms = 2500;
  assert(repo.ListInstances(*tx, silent).empty());
  silent.heartbeat_before_ms = 2501;
  assert(repo.ListInstances(*tx, silent).size() == 1);

  InstanceFilter by_list;
  by_list.task_list_id = "list-" + prefix + "-other";
  assert(repo.ListInstances(*tx, by_list).size() == 1);

  tx->Commit();
}

void VerifyTranscriptAndProjections(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  auto instance  = MakeInstance(prefix + "-instance", prefix + "-task", 1000);
  auto execution = MakeExecution(prefix + "-execution", instance);
  assert(repo.InsertInstance(*tx, instance));
  assert(repo.InsertExecution(*tx, execution));
  tx->Commit();

  {
    auto dup_tx = repo.Begin();
    auto second = MakeExecution(prefix + "-execution-2", instance);
    assert(!repo.InsertExecution(*dup_tx, second));
    dup_tx->Rollback();
  }

  tx               = repo.Begin();
  auto by_instance = repo.GetExecutionByInstance(*tx, instance.instance_id);
  assert(by_instance.has_value());
  assert(by_instance->execution_id == execution.execution_id);
  assert(by_instance->completed_at_ms == 0);

  assert(repo.GetMaxSequence(*tx, execution.execution_id) == 0);

  auto first = MakeEntry(prefix + "-e1", execution, ENTRY_TYPE_LIFECYCLE);
  auto tool  = MakeEntry(prefix + "-e2", execution, ENTRY_TYPE_TOOL_USE);
  auto check = MakeEntry(prefix + "-e3", execution, ENTRY_TYPE_ASSERTION);
  first.sequence = 42; // ignored, the store assigns
  assert(repo.AppendTranscriptEntry(*tx, first));
  assert(repo.AppendTranscriptEntry(*tx, tool));
  assert(repo.AppendTranscriptEntry(*tx, check));
  assert(first.sequence == 1);
  assert(tool.sequence == 2);
  assert(check.sequence == 3);
  assert(repo.GetMaxSequence(*tx, execution.execution_id) == 3);

  auto orphan = MakeEntry(prefix + "-orphan", execution, ENTRY_TYPE_LIFECYCLE);
  orphan.execution_id = prefix + "-no-such-execution";
  assert(!repo.AppendTranscriptEntry(*tx, orphan));

  ToolUseRecord ok_tool{.entry_id = tool.entry_id, .execution_id = execution.execution_id, .sequence = tool.sequence, .tool = "bash"};
  assert(repo.InsertToolUse(*tx, ok_tool));

  auto failed_tool = MakeEntry(prefix + "-e4", execution, ENTRY_TYPE_TOOL_USE);
  assert(repo.AppendTranscriptEntry(*tx, failed_tool));
  ToolUseRecord bad_tool{.entry_id      = failed_tool.entry_id,
                         .execution_id  = execution.execution_id,
                         .sequence      = failed_tool.sequence,
                         .tool          = "edit",
                         .input_summary = "patch main.cpp",
                         .is_error      = true,
                         .is_blocked    = true,
                         .duration_ms   = 12,
                         .error_message = "rejected"};
  assert(repo.InsertToolUse(*tx, bad_tool));

  AssertionResultRecord pass{.entry_id     = check.entry_id,
                             .execution_id = execution.execution_id,
                             .sequence     = check.sequence,
                             .assertion_id = "build",
                             .category     = "compile",
                             .result       = ASSERTION_OUTCOME_PASS,
                             .chain_id       = "chain-compile",
                             .chain_position = 4};
  assert(repo.InsertAssertionResult(*tx, pass));

  tx->Commit();

  auto read_tx = repo.Begin();

  auto full = repo.ReadTranscript(*read_tx, execution.execution_id, 0, std::nullopt);
  assert(full.size() == 4);
  for (size_t i = 0; i < full.size(); ++i) {
    assert(full[i].sequence == i + 1);
  }
  assert(full[0].payload_json.find("\"k\"") != std::string::npos);
  assert(full[1].entry_type == ENTRY_TYPE_TOOL_USE);

  auto tail = repo.ReadTranscript(*read_tx, execution.execution_id, 3, std::nullopt);
  assert(tail.size() == 2);
  assert(tail[0].sequence == 3);

  auto limited = repo.ReadTranscript(*read_tx, execution.execution_id, 2, 1);
  assert(limited.size() == 1);
  assert(limited[0].sequence == 2);

  auto tools = repo.ListToolUses(*read_tx, execution.execution_id, false);
  assert(tools.size() == 2);
  assert(tools[0].tool == "bash");

  auto errors = repo.ListToolUses(*read_tx, execution.execution_id, true);
  assert(errors.size() == 1);
  assert(errors[0].tool == "edit");
  assert(errors[0].is_blocked);
  assert(errors[0].duration_ms == 12);
  assert(errors[0].error_message == "rejected");

  auto assertions = repo.ListAssertionResults(*read_tx, execution.execution_id);
  assert(assertions.size() == 1);
  assert(assertions[0].result == ASSERTION_OUTCOME_PASS);
  assert(assertions[0].category == "compile");
  assert(assertions[0].chain_id == "chain-compile");
  assert(assertions[0].chain_position == 4);

  assert(repo.ReadTranscript(*read_tx, prefix + "-unknown", 0, std::nullopt).empty());
  read_tx->Commit();

  auto close_tx          = repo.Begin();
  auto closed            = *repo.GetExecution(*close_tx, execution.execution_id);
  closed.completed_at_ms = 5000;
  closed.outcome         = "completed";
  assert(repo.UpdateExecution(*close_tx, closed));
  close_tx->Commit();

  auto verify_tx = repo.Begin();
  auto final     = repo.GetExecution(*verify_tx, execution.execution_id);
  assert(final.has_value());
  assert(final->completed_at_ms == 5000);
  assert(final->outcome == "completed");
  verify_tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx        = repo.Begin();
    auto instance  = MakeInstance(prefix + "-kept", prefix, 1);
    auto execution = MakeExecution(prefix + "-kept-exec", instance);
    assert(repo.InsertInstance(*tx, instance));
    assert(repo.InsertExecution(*tx, execution));
    auto entry = MakeEntry(prefix + "-kept-e1", execution, ENTRY_TYPE_LIFECYCLE);
    assert(repo.AppendTranscriptEntry(*tx, entry));
    tx->Commit();
  }

  {
    auto tx       = repo.Begin();
    auto instance = MakeInstance(prefix + "-dropped", prefix, 2);
    assert(repo.InsertInstance(*tx, instance));

    auto kept   = *repo.GetInstance(*tx, prefix + "-kept");
    kept.status = INSTANCE_STATUS_RUNNING;
    assert(repo.UpdateInstance(*tx, kept, kept.version));

    auto execution = *repo.GetExecution(*tx, prefix + "-kept-exec");
    auto entry     = MakeEntry(prefix + "-kept-e2", execution, ENTRY_TYPE_ASSERTION);
    assert(repo.AppendTranscriptEntry(*tx, entry));
    AssertionResultRecord fail{.entry_id     = entry.entry_id,
                               .execution_id = execution.execution_id,
                               .sequence     = entry.sequence,
                               .assertion_id = "lint",
                               .result       = ASSERTION_OUTCOME_FAIL};
    assert(repo.InsertAssertionResult(*tx, fail));
    tx->Rollback();
  }

  {
    // destructor rolls back an unfinished transaction
    auto tx       = repo.Begin();
    auto instance = MakeInstance(prefix + "-abandoned", prefix, 3);
    assert(repo.InsertInstance(*tx, instance));
  }

  auto tx = repo.Begin();
  assert(!repo.GetInstance(*tx, prefix + "-dropped").has_value());
  assert(!repo.GetInstance(*tx, prefix + "-abandoned").has_value());

  auto kept = repo.GetInstance(*tx, prefix + "-kept");
  assert(kept.has_value());
  assert(kept->status == INSTANCE_STATUS_PENDING);
  assert(kept->version == 1);

  assert(repo.GetMaxSequence(*tx, prefix + "-kept-exec") == 1);
  assert(repo.ListAssertionResults(*tx, prefix + "-kept-exec").empty());
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx   = repo.Begin();
    auto seed = MakeInstance(id, id, 1);
    assert(repo.InsertInstance(*tx, seed));
    tx->Commit();
  }

  // Single-writer backends serialize Begin(); the CAS is exercised
  // sequentially above.
  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto r1  = repo.GetInstance(*tx1, id);
  assert(r1.has_value());
  r1->status = INSTANCE_STATUS_RUNNING;
  assert(repo.UpdateInstance(*tx1, *r1, 1));
  tx1->Commit();

  auto tx2 = repo.Begin();
  auto r2  = *repo.GetInstance(*tx2, id);
  r2.status    = INSTANCE_STATUS_COMPLETED;
  auto outcome = repo.UpdateInstance(*tx2, r2, 1);
  assert(outcome.code == ErrorCode::Conflict);
  tx2->Rollback();

  auto verify_tx = repo.Begin();
  auto final     = repo.GetInstance(*verify_tx, id);
  assert(final.has_value());
  assert(final->status == INSTANCE_STATUS_RUNNING);
  assert(final->version == 2);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx        = repo->Begin();
    auto instance  = MakeInstance(id, id + "-task", 10);
    auto execution = MakeExecution(id + "-exec", instance);
    assert(repo->InsertInstance(*tx, instance));
    assert(repo->InsertExecution(*tx, execution));

    auto e1 = MakeEntry(id + "-e1", execution, ENTRY_TYPE_LIFECYCLE);
    auto e2 = MakeEntry(id + "-e2", execution, ENTRY_TYPE_LIFECYCLE);
    assert(repo->AppendTranscriptEntry(*tx, e1));
    assert(repo->AppendTranscriptEntry(*tx, e2));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto i  = repo->GetInstance(*tx, id);
  assert(i.has_value());
  assert(i->task_id == id + "-task");

  // sequences continue after restart
  auto execution = *repo->GetExecution(*tx, id + "-exec");
  auto e3        = MakeEntry(id + "-e3", execution, ENTRY_TYPE_LIFECYCLE);
  assert(repo->AppendTranscriptEntry(*tx, e3));
  assert(e3.sequence == 3);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = false,
  };
}

#if SUPERVISOR_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("agent_supervisor_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<supervisor::db::sqlite::SqliteDB>(db_path);
    supervisor::db::sql::RunMigrations(*db, supervisor::db::sql::SqliteSchema());
    return std::make_shared<supervisor::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if SUPERVISOR_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SUPERVISOR_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SUPERVISOR_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<supervisor::db::postgres::PgPool>(conninfo);
    {
      supervisor::db::postgres::PgMigrationExecutor executor(pool);
      supervisor::db::sql::RunMigrations(executor, supervisor::db::sql::PostgresSchema());
    }
    return std::make_shared<supervisor::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  // ids are unique per run so a shared postgres database can be reused
  const auto run = backend.name + "-" + std::to_string(NowMs());
  auto       repo = backend.make_repository();

  VerifyInstanceCompareAndSwap(*repo, run + "-cas");
  VerifyInstanceListing(*repo, run + "-list");
  VerifyTranscriptAndProjections(*repo, run + "-transcript");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyConcurrentUpdates(*repo, run + "-concurrency", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SUPERVISOR_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SUPERVISOR_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& e) {
    std::cout << "skipping postgres backend: " << e.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "agent_supervisor_integration_repository_parity: pass\n";
  return 0;
}
