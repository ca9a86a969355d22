#include "internal/query/reconciled_state_query.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/heartbeat/heartbeat_ingest.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/telemetry/event_emitter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "supervisor/v1.hpp"

namespace {

using namespace supervisor::v1;
using supervisor::query::ReconciledStateQuery;

constexpr uint64_t kT0 = 1'000'000;

struct Fixture {
  Fixture() {
    liveness.heartbeat_interval_ms    = 10'000;
    liveness.stale_timeout_multiplier = 3.0;
    query  = std::make_unique<ReconciledStateQuery>(repository, clock, liveness);
    ingest = std::make_unique<supervisor::heartbeat::HeartbeatIngest>(registry, nullptr, liveness);
  }

  void Beat(const std::string& instance_id, uint64_t at_ms) {
    HeartbeatRequest req;
    req.set_instance_id(instance_id);
    *req.mutable_timestamp() = supervisor::util::MillisToProto(at_ms);
    ingest->Heartbeat(req);
  }

  void Assert(const supervisor::registry::CreatedInstance& created, const std::string& assertion_id, const std::string& result,
              const std::string& chain_id = {}, uint32_t chain_position = 0) {
    EmitRequest req;
    req.set_execution_id(created.execution_id);
    req.set_instance_id(created.instance_id);
    req.set_entry_type(ENTRY_TYPE_ASSERTION);
    req.set_category("tests");
    req.set_summary(assertion_id);
    auto& fields = *req.mutable_payload()->mutable_fields();
    fields["assertion_id"].set_string_value(assertion_id);
    fields["result"].set_string_value(result);
    if (!chain_id.empty()) {
      fields["chain_id"].set_string_value(chain_id);
      fields["chain_position"].set_number_value(chain_position);
    }
    emitter.Emit(req);
  }

  void Tool(const supervisor::registry::CreatedInstance& created, const std::string& tool, bool is_error) {
    EmitRequest req;
    req.set_execution_id(created.execution_id);
    req.set_instance_id(created.instance_id);
    req.set_entry_type(ENTRY_TYPE_TOOL_USE);
    req.set_category("tool");
    auto& fields = *req.mutable_payload()->mutable_fields();
    fields["tool"].set_string_value(tool);
    fields["is_error"].set_bool_value(is_error);
    emitter.Emit(req);
  }

  std::shared_ptr<supervisor::db::memory::MemoryRepository> repository = std::make_shared<supervisor::db::memory::MemoryRepository>();
  std::shared_ptr<supervisor::util::ManualClock>            clock      = std::make_shared<supervisor::util::ManualClock>(kT0);
  std::shared_ptr<supervisor::registry::InstanceRegistry>   registry   = std::make_shared<supervisor::registry::InstanceRegistry>(repository, clock);
  supervisor::telemetry::EventEmitter                       emitter{repository, nullptr, clock};
  supervisor::config::LivenessOptions                       liveness;
  std::unique_ptr<ReconciledStateQuery>                     query;
  std::unique_ptr<supervisor::heartbeat::HeartbeatIngest>   ingest;
};

void TestUnknownInstanceIsNotFoundFlag() {
  Fixture f;
  auto    status = f.query->GetEffectiveStatus("no-such-instance");
  assert(!status.found());
  assert(status.instance_id() == "no-such-instance");
}

void TestStalenessIsDerivedAtReadTime() {
  Fixture f;
  auto    created = f.registry->CreateInstance("task-1", "list-1");

  auto pending = f.query->GetEffectiveStatus(created.instance_id);
  assert(pending.found());
  assert(pending.status() == INSTANCE_STATUS_PENDING);
  assert(!pending.is_stale());
  assert(!pending.has_last_seen_ago_ms());
  assert(pending.execution_id() == created.execution_id);
  assert(pending.task_list_id() == "list-1");

  f.Beat(created.instance_id, kT0 + 1'000);

  f.clock->SetMs(kT0 + 31'000);
  auto fresh = f.query->GetEffectiveStatus(created.instance_id);
  assert(fresh.status() == INSTANCE_STATUS_RUNNING);
  assert(!fresh.is_stale());
  assert(fresh.last_seen_ago_ms() == 30'000);

  // nothing is written, only the clock moved
  f.clock->SetMs(kT0 + 31'001);
  auto stale = f.query->GetEffectiveStatus(created.instance_id);
  assert(stale.status() == INSTANCE_STATUS_RUNNING);
  assert(stale.is_stale());

  f.registry->MarkTerminal(created.instance_id, INSTANCE_STATUS_FAILED, "oom");
  auto failed = f.query->GetEffectiveStatus(created.instance_id);
  assert(failed.status() == INSTANCE_STATUS_FAILED);
  assert(!failed.is_stale());
  assert(failed.termination_reason() == "oom");
}

void TestListInstancesFilters() {
  Fixture f;
  auto    live    = f.registry->CreateInstance("task-1", "list-1");
  auto    silent  = f.registry->CreateInstance("task-1", "list-1");
  auto    done    = f.registry->CreateInstance("task-1", "list-1");
  auto    other   = f.registry->CreateInstance("task-2", "list-2");
  auto    waiting = f.registry->CreateInstance("task-1", "list-1");

  f.Beat(live.instance_id, kT0);
  f.Beat(silent.instance_id, kT0);
  f.Beat(done.instance_id, kT0);
  f.Beat(other.instance_id, kT0);
  f.registry->MarkTerminal(done.instance_id, INSTANCE_STATUS_COMPLETED, "");

  f.clock->SetMs(kT0 + 40'000);
  f.Beat(live.instance_id, kT0 + 40'000);

  ListInstancesRequest by_task;
  by_task.set_task_id("task-1");
  // terminal rows are hidden by default
  assert(f.query->ListInstances(by_task).instances_size() == 3);

  by_task.set_include_terminal(true);
  assert(f.query->ListInstances(by_task).instances_size() == 4);

  ListInstancesRequest explicit_status;
  explicit_status.add_statuses(INSTANCE_STATUS_COMPLETED);
  auto completed = f.query->ListInstances(explicit_status);
  assert(completed.instances_size() == 1);
  assert(completed.instances(0).instance_id() == done.instance_id);

  ListInstancesRequest stale_only;
  stale_only.set_stale_only(true);
  auto stale = f.query->ListInstances(stale_only);
  assert(stale.instances_size() == 2);
  for (const auto& status : stale.instances()) {
    assert(status.is_stale());
    assert(status.instance_id() == silent.instance_id || status.instance_id() == other.instance_id);
  }

  stale_only.set_task_list_id("list-2");
  assert(f.query->ListInstances(stale_only).instances_size() == 1);

  ListInstancesRequest paged;
  paged.set_task_id("task-1");
  paged.set_limit(2);
  auto first_page = f.query->ListInstances(paged);
  assert(first_page.instances_size() == 2);
  paged.set_offset(2);
  auto second_page = f.query->ListInstances(paged);
  assert(second_page.instances_size() == 1);
  assert(second_page.instances(0).instance_id() != first_page.instances(0).instance_id());
  assert(second_page.instances(0).instance_id() != first_page.instances(1).instance_id());

  (void)waiting;
}

void TestTranscriptReads() {
  Fixture f;
  auto    created = f.registry->CreateInstance("task-1", "list-1");
  f.Beat(created.instance_id, kT0);

  f.Tool(created, "bash", false);
  f.Tool(created, "edit", true);
  f.Tool(created, "grep", false);

  auto all = f.query->GetTranscript(created.execution_id, 0, std::nullopt);
  assert(all.entries_size() == 3);
  assert(all.entries(0).sequence() == 1);
  assert(all.entries(2).payload().fields().at("tool").string_value() == "grep");

  auto window = f.query->GetTranscript(created.execution_id, 2, 1);
  assert(window.entries_size() == 1);
  assert(window.entries(0).sequence() == 2);

  auto tools = f.query->ListToolUses(created.execution_id, false);
  assert(tools.tool_uses_size() == 3);
  auto errors = f.query->ListToolUses(created.execution_id, true);
  assert(errors.tool_uses_size() == 1);
  assert(errors.tool_uses(0).tool() == "edit");

  auto execution = f.query->GetExecution(created.instance_id);
  assert(execution.execution_id() == created.execution_id);
  assert(execution.task_id() == "task-1");

  bool threw = false;
  try {
    f.query->GetTranscript("no-such-execution", 0, std::nullopt);
  } catch (const supervisor::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.query->GetExecution("no-such-instance");
  } catch (const supervisor::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestAssertionSummary() {
  Fixture f;
  auto    created = f.registry->CreateInstance("task-1", "list-1");
  f.Beat(created.instance_id, kT0);

  auto empty = f.query->GetAssertionSummary(created.execution_id);
  assert(empty.total() == 0);
  assert(empty.pass_rate() == 1.0);

  f.Assert(created, "compiles", "pass");
  f.Assert(created, "unit", "fail");
  f.Assert(created, "lint", "warn");
  f.Assert(created, "e2e", "skip");

  auto summary = f.query->GetAssertionSummary(created.execution_id);
  assert(summary.execution_id() == created.execution_id);
  assert(summary.total() == 4);
  assert(summary.passed() == 1);
  assert(summary.failed() == 1);
  assert(summary.warnings() == 1);
  assert(summary.skipped() == 1);
  assert(std::fabs(summary.pass_rate() - 0.25) < 1e-9);
  assert(summary.failures_size() == 1);
  assert(summary.failures(0).assertion_id() == "unit");
  assert(summary.failures(0).category() == "tests");
  assert(summary.failures(0).chain_id().empty());
  assert(summary.chains_size() == 0);

  bool threw = false;
  try {
    f.query->GetAssertionSummary("no-such-execution");
  } catch (const supervisor::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestAssertionChainsAreSummarized() {
  Fixture f;
  auto    created = f.registry->CreateInstance("task-1", "list-1");
  f.Beat(created.instance_id, kT0);

  f.Assert(created, "schema", "pass", "chain-db", 0);
  f.Assert(created, "loose", "pass");
  f.Assert(created, "migrate", "fail", "chain-db", 1);
  f.Assert(created, "docs", "skip", "chain-docs", 0);
  f.Assert(created, "seed", "fail", "chain-db", 2);
  f.Assert(created, "api", "pass", "chain-api", 0);

  auto summary = f.query->GetAssertionSummary(created.execution_id);
  assert(summary.total() == 6);
  assert(summary.chains_size() == 3);

  const auto& db = summary.chains(0);
  assert(db.chain_id() == "chain-db");
  assert(db.total() == 3);
  assert(db.passed() == 1);
  assert(db.failed() == 2);
  assert(db.overall() == ASSERTION_OUTCOME_FAIL);
  assert(db.first_failure_id() == "migrate");

  const auto& docs = summary.chains(1);
  assert(docs.chain_id() == "chain-docs");
  assert(docs.overall() == ASSERTION_OUTCOME_SKIP);
  assert(docs.first_failure_id().empty());

  const auto& api = summary.chains(2);
  assert(api.chain_id() == "chain-api");
  assert(api.overall() == ASSERTION_OUTCOME_PASS);

  assert(summary.failures_size() == 2);
  assert(summary.failures(0).chain_id() == "chain-db");
  assert(summary.failures(0).chain_position() == 1);
}

} // namespace

int main() {
  TestUnknownInstanceIsNotFoundFlag();
  TestStalenessIsDerivedAtReadTime();
  TestListInstancesFilters();
  TestTranscriptReads();
  TestAssertionSummary();
  TestAssertionChainsAreSummarized();

  std::cout << "agent_supervisor_unit_reconciled_state_query: pass\n";
  return 0;
}
