#include "internal/registry/instance_registry.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using supervisor::core::v1::INSTANCE_STATUS_COMPLETED;
using supervisor::core::v1::INSTANCE_STATUS_FAILED;
using supervisor::core::v1::INSTANCE_STATUS_PENDING;
using supervisor::core::v1::INSTANCE_STATUS_RUNNING;
using supervisor::core::v1::INSTANCE_STATUS_TERMINATED;
using supervisor::registry::InstanceRegistry;

struct Fixture {
  std::shared_ptr<supervisor::db::memory::MemoryRepository> repository = std::make_shared<supervisor::db::memory::MemoryRepository>();
  std::shared_ptr<supervisor::util::ManualClock>            clock      = std::make_shared<supervisor::util::ManualClock>(1'000);
  InstanceRegistry                                          registry{repository, clock};
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestCreateInstanceOpensExecution() {
  Fixture f;

  auto created = f.registry.CreateInstance("task-1", "list-1", "4242", "host-a");
  assert(!created.instance_id.empty());
  assert(!created.execution_id.empty());
  assert(created.instance_id != created.execution_id);

  auto record = f.registry.GetInstance(created.instance_id);
  assert(record.has_value());
  assert(record->status == INSTANCE_STATUS_PENDING);
  assert(record->task_list_id == "list-1");
  assert(record->pid == "4242");
  assert(record->hostname == "host-a");
  assert(record->started_at_ms == 1'000);
  assert(record->last_heartbeat_at_ms == 0);

  auto tx        = f.repository->Begin();
  auto execution = f.repository->GetExecutionByInstance(*tx, created.instance_id);
  tx->Commit();
  assert(execution.has_value());
  assert(execution->execution_id == created.execution_id);
  assert(execution->task_id == "task-1");
  assert(execution->completed_at_ms == 0);

  assert(Throws<supervisor::util::InvalidArgument>([&] { f.registry.CreateInstance("", "list-1"); }));
}

void TestLifecycleOrdering() {
  Fixture f;
  auto    created = f.registry.CreateInstance("task-1", "list-1");

  // pending cannot skip running
  assert(Throws<supervisor::util::InvalidTransition>(
      [&] { f.registry.MarkTerminal(created.instance_id, INSTANCE_STATUS_COMPLETED, ""); }));

  auto running = f.registry.MarkRunning(created.instance_id);
  assert(running.status == INSTANCE_STATUS_RUNNING);
  assert(Throws<supervisor::util::InvalidTransition>([&] { f.registry.MarkRunning(created.instance_id); }));

  assert(Throws<supervisor::util::InvalidArgument>(
      [&] { f.registry.MarkTerminal(created.instance_id, INSTANCE_STATUS_RUNNING, "x"); }));
  assert(Throws<supervisor::util::NotFound>([&] { f.registry.MarkRunning("no-such-instance"); }));
}

void TestCompletedDropsReasonAndClosesExecution() {
  Fixture f;
  auto    created = f.registry.CreateInstance("task-1", "list-1");
  f.registry.MarkRunning(created.instance_id);

  f.clock->SetMs(5'000);
  auto outcome = f.registry.MarkTerminal(created.instance_id, INSTANCE_STATUS_COMPLETED, "ignored");
  assert(outcome.applied);
  assert(outcome.instance.status == INSTANCE_STATUS_COMPLETED);
  assert(outcome.instance.termination_reason.empty());
  assert(outcome.instance.terminated_at_ms == 5'000);

  auto tx        = f.repository->Begin();
  auto execution = f.repository->GetExecution(*tx, created.execution_id);
  tx->Commit();
  assert(execution.has_value());
  assert(execution->completed_at_ms == 5'000);
  assert(execution->outcome == "completed");
}

void TestRepeatedTerminalIsIdempotent() {
  Fixture f;
  auto    created = f.registry.CreateInstance("task-1", "list-1");
  f.registry.MarkRunning(created.instance_id);

  auto first = f.registry.MarkTerminal(created.instance_id, INSTANCE_STATUS_FAILED, "exit code 2");
  assert(first.applied);

  f.clock->AdvanceMs(10'000);
  auto again = f.registry.MarkTerminal(created.instance_id, INSTANCE_STATUS_FAILED, "exit code 2");
  assert(!again.applied);
  assert(again.instance.terminated_at_ms == first.instance.terminated_at_ms);
  assert(again.instance.version == first.instance.version);

  // different reason on a terminal instance is a conflict, not an overwrite
  assert(Throws<supervisor::util::ConflictingTransition>(
      [&] { f.registry.MarkTerminal(created.instance_id, INSTANCE_STATUS_FAILED, "exit code 3"); }));
  assert(Throws<supervisor::util::ConflictingTransition>(
      [&] { f.registry.MarkTerminal(created.instance_id, INSTANCE_STATUS_COMPLETED, ""); }));

  auto stored = f.registry.GetInstance(created.instance_id);
  assert(stored->status == INSTANCE_STATUS_FAILED);
  assert(stored->termination_reason == "exit code 2");
}

void TestReasonRequiredForFailureStatuses() {
  Fixture f;
  auto    created = f.registry.CreateInstance("task-1", "list-1");
  f.registry.MarkRunning(created.instance_id);

  assert(Throws<supervisor::util::InvalidArgument>([&] { f.registry.MarkTerminal(created.instance_id, INSTANCE_STATUS_FAILED, ""); }));
  assert(Throws<supervisor::util::InvalidArgument>([&] { f.registry.MarkTerminal(created.instance_id, INSTANCE_STATUS_TERMINATED, ""); }));
  assert(f.registry.GetInstance(created.instance_id)->status == INSTANCE_STATUS_RUNNING);
}

// Worker exit report racing the reaper: exactly one terminal write lands.
void TestConcurrentTerminalWritersAgreeOnOneOutcome() {
  for (int round = 0; round < 50; ++round) {
    Fixture f;
    auto    created = f.registry.CreateInstance("task-1", "list-1");
    f.registry.MarkRunning(created.instance_id);

    std::atomic<int> applied{0};
    std::atomic<int> conflicts{0};

    auto writer = [&](supervisor::core::v1::InstanceStatus status, const std::string& reason) {
      try {
        auto outcome = f.registry.MarkTerminal(created.instance_id, status, reason);
        if (outcome.applied) {
          applied.fetch_add(1);
        }
      } catch (const supervisor::util::ConflictingTransition&) {
        conflicts.fetch_add(1);
      }
    };

    std::thread worker(writer, INSTANCE_STATUS_FAILED, "crash");
    std::thread reaper(writer, INSTANCE_STATUS_TERMINATED, "stale_heartbeat");
    worker.join();
    reaper.join();

    assert(applied.load() == 1);
    assert(conflicts.load() == 1);

    auto stored = f.registry.GetInstance(created.instance_id);
    assert(stored->status == INSTANCE_STATUS_FAILED || stored->status == INSTANCE_STATUS_TERMINATED);
    if (stored->status == INSTANCE_STATUS_FAILED) {
      assert(stored->termination_reason == "crash");
    } else {
      assert(stored->termination_reason == "stale_heartbeat");
    }
  }
}

void TestMarkTerminalIfStaleRechecksSilence() {
  Fixture f;
  auto    created = f.registry.CreateInstance("task-1", "list-1");
  f.registry.MarkRunning(created.instance_id);

  // started_at is the baseline; exactly at the timeout is still alive
  f.clock->SetMs(1'000 + 90'000);
  assert(!f.registry.MarkTerminalIfStale(created.instance_id, 90'000, "stale_heartbeat").has_value());
  assert(f.registry.GetInstance(created.instance_id)->status == INSTANCE_STATUS_RUNNING);

  assert(Throws<supervisor::util::InvalidArgument>([&] { f.registry.MarkTerminalIfStale(created.instance_id, 90'000, ""); }));

  f.clock->AdvanceMs(1);
  auto reaped = f.registry.MarkTerminalIfStale(created.instance_id, 90'000, "stale_heartbeat");
  assert(reaped.has_value());
  assert(reaped->applied);
  assert(reaped->execution_id == created.execution_id);
  assert(reaped->instance.status == INSTANCE_STATUS_TERMINATED);
  assert(reaped->instance.termination_reason == "stale_heartbeat");
  assert(reaped->instance.terminated_at_ms == 1'000 + 90'001);

  // no longer running, so no longer a candidate
  f.clock->AdvanceMs(60'000);
  assert(!f.registry.MarkTerminalIfStale(created.instance_id, 90'000, "stale_heartbeat").has_value());
}

void TestAttachProcess() {
  Fixture f;
  auto    created = f.registry.CreateInstance("task-1", "list-1", "", "host-a");

  auto attached = f.registry.AttachProcess(created.instance_id, "777");
  assert(attached.pid == "777");
  assert(attached.hostname == "host-a");

  attached = f.registry.AttachProcess(created.instance_id, "778", "host-b");
  assert(attached.pid == "778");
  assert(attached.hostname == "host-b");

  assert(Throws<supervisor::util::InvalidArgument>([&] { f.registry.AttachProcess(created.instance_id, ""); }));

  f.registry.MarkRunning(created.instance_id);
  f.registry.MarkTerminal(created.instance_id, INSTANCE_STATUS_TERMINATED, "operator");
  assert(Throws<supervisor::util::InstanceTerminated>([&] { f.registry.AttachProcess(created.instance_id, "779"); }));
}

} // namespace

int main() {
  TestCreateInstanceOpensExecution();
  TestLifecycleOrdering();
  TestCompletedDropsReasonAndClosesExecution();
  TestRepeatedTerminalIsIdempotent();
  TestReasonRequiredForFailureStatuses();
  TestConcurrentTerminalWritersAgreeOnOneOutcome();
  TestMarkTerminalIfStaleRechecksSilence();
  TestAttachProcess();

  std::cout << "agent_supervisor_unit_instance_registry: pass\n";
  return 0;
}
