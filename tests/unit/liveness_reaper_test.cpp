#include "internal/reaper/liveness_reaper.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/heartbeat/heartbeat_ingest.hpp"
#include "internal/query/reconciled_state_query.hpp"
#include "internal/reaper/process_controller.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/telemetry/event_emitter.hpp"
#include "internal/telemetry/resilient_emitter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "supervisor/v1.hpp"
#include "flaky_repository.hpp"

namespace {

using namespace supervisor::v1;
using supervisor::reaper::LivenessReaper;
using supervisor::testing::FlakyRepository;

constexpr uint64_t kSecond = 1'000;
constexpr uint64_t kT0     = 1'000'000;

class FakeProcesses final : public supervisor::reaper::ProcessController {
 public:
  bool IsAlive(const std::string& pid) override {
    return alive.count(pid) > 0;
  }

  bool Terminate(const std::string& pid) override {
    terminated.push_back(pid);
    alive.erase(pid);
    return true;
  }

  std::set<std::string>    alive;
  std::vector<std::string> terminated;
};

struct Fixture {
  Fixture() {
    // heartbeat every 30s, stale after 90s
    liveness.heartbeat_interval_ms    = 30 * kSecond;
    liveness.stale_timeout_multiplier = 3.0;

    options.tick_period_ms       = 10 * kSecond;
    options.alert_after_failures = 3;

    registry    = std::make_shared<supervisor::registry::InstanceRegistry>(repository, clock);
    auto events = std::make_shared<supervisor::telemetry::EventEmitter>(repository, nullptr, clock);
    emitter     = std::make_shared<supervisor::telemetry::ResilientEmitter>(events, supervisor::util::BackoffPolicy{}, 16,
                                                                            [](std::chrono::milliseconds) {});
    ingest      = std::make_shared<supervisor::heartbeat::HeartbeatIngest>(registry, emitter, liveness);
    query       = std::make_shared<supervisor::query::ReconciledStateQuery>(repository, clock, liveness);
    reaper      = std::make_unique<LivenessReaper>(registry, emitter, processes, liveness, options);
  }

  void Beat(const std::string& instance_id, uint64_t at_ms) {
    clock->SetMs(at_ms);
    HeartbeatRequest req;
    req.set_instance_id(instance_id);
    *req.mutable_timestamp() = supervisor::util::MillisToProto(at_ms);
    assert(ingest->Heartbeat(req).accepted());
  }

  std::shared_ptr<FlakyRepository>                         repository = std::make_shared<FlakyRepository>();
  std::shared_ptr<supervisor::util::ManualClock>           clock      = std::make_shared<supervisor::util::ManualClock>(kT0);
  std::shared_ptr<FakeProcesses>                           processes  = std::make_shared<FakeProcesses>();
  supervisor::config::LivenessOptions                      liveness;
  supervisor::config::ReaperOptions                        options;
  std::shared_ptr<supervisor::registry::InstanceRegistry>  registry;
  std::shared_ptr<supervisor::telemetry::ResilientEmitter> emitter;
  std::shared_ptr<supervisor::heartbeat::HeartbeatIngest>  ingest;
  std::shared_ptr<supervisor::query::ReconciledStateQuery> query;
  std::unique_ptr<LivenessReaper>                          reaper;
};

// Heartbeats at t=0,30,60 then silence; stale after t=150, reaped at t=160.
void TestSilentInstanceIsReaped() {
  Fixture f;
  auto    created = f.registry->CreateInstance("task-1", "list", "4242", "host-a");
  f.processes->alive.insert("4242");

  f.Beat(created.instance_id, kT0);
  f.Beat(created.instance_id, kT0 + 30 * kSecond);
  f.Beat(created.instance_id, kT0 + 60 * kSecond);

  f.clock->SetMs(kT0 + 150 * kSecond);
  auto at_limit = f.query->GetEffectiveStatus(created.instance_id);
  assert(at_limit.status() == INSTANCE_STATUS_RUNNING);
  assert(!at_limit.is_stale());
  assert(f.reaper->Tick().stale == 0);

  f.clock->SetMs(kT0 + 155 * kSecond);
  auto stale = f.query->GetEffectiveStatus(created.instance_id);
  assert(stale.status() == INSTANCE_STATUS_RUNNING);
  assert(stale.is_stale());
  assert(stale.last_seen_ago_ms() == 95 * kSecond);

  f.clock->SetMs(kT0 + 160 * kSecond);
  auto report = f.reaper->Tick();
  assert(report.stale == 1);
  assert(report.reaped == 1);
  assert(report.signalled == 1);
  assert(f.processes->terminated.size() == 1);
  assert(f.processes->terminated[0] == "4242");

  auto reaped = f.query->GetEffectiveStatus(created.instance_id);
  assert(reaped.status() == INSTANCE_STATUS_TERMINATED);
  assert(reaped.termination_reason() == "stale_heartbeat");
  assert(!reaped.is_stale());

  // the supervisor records why, even though the instance is now terminal
  auto transcript = f.query->GetTranscript(created.execution_id, 0, std::nullopt);
  assert(transcript.entries_size() == 1);
  const auto& entry = transcript.entries(0);
  assert(entry.entry_type() == ENTRY_TYPE_LIFECYCLE);
  assert(entry.category() == "reaped");
  assert(entry.payload().fields().at("reason").string_value() == "stale_heartbeat");
  assert(entry.payload().fields().at("silence_ms").number_value() == 100.0 * kSecond);

  auto execution = f.query->GetExecution(created.instance_id);
  assert(execution.outcome() == "terminated");

  // repeat ticks are no-ops
  auto again = f.reaper->Tick();
  assert(again.stale == 0);
  assert(again.reaped == 0);
  assert(f.query->GetTranscript(created.execution_id, 0, std::nullopt).entries_size() == 1);
}

void TestHealthyAndPendingInstancesAreLeftAlone() {
  Fixture f;
  auto    healthy = f.registry->CreateInstance("task-1", "list");
  auto    pending = f.registry->CreateInstance("task-2", "list");

  f.Beat(healthy.instance_id, kT0 + 10 * kSecond);
  f.clock->SetMs(kT0 + 95 * kSecond);
  f.Beat(healthy.instance_id, kT0 + 95 * kSecond);

  f.clock->SetMs(kT0 + 500 * kSecond);
  f.Beat(healthy.instance_id, kT0 + 500 * kSecond);

  auto report = f.reaper->Tick();
  assert(report.stale == 0);
  assert(f.registry->GetInstance(healthy.instance_id)->status == INSTANCE_STATUS_RUNNING);
  // pending instances never sent a heartbeat and are not the reaper's concern
  assert(f.registry->GetInstance(pending.instance_id)->status == INSTANCE_STATUS_PENDING);
}

void TestRunningWithoutHeartbeatUsesStartTime() {
  Fixture f;
  auto    created = f.registry->CreateInstance("task-1", "list");
  f.registry->MarkRunning(created.instance_id);

  f.clock->SetMs(kT0 + 80 * kSecond);
  assert(f.reaper->Tick().stale == 0);

  f.clock->SetMs(kT0 + 91 * kSecond);
  auto report = f.reaper->Tick();
  assert(report.reaped == 1);
  // no pid recorded, nothing to signal
  assert(report.signalled == 0);
}

void TestWorkerReportWinsOverReaper() {
  Fixture f;
  auto    created = f.registry->CreateInstance("task-1", "list");
  f.Beat(created.instance_id, kT0);

  f.clock->SetMs(kT0 + 200 * kSecond);
  f.registry->MarkTerminal(created.instance_id, INSTANCE_STATUS_COMPLETED, "");

  auto report = f.reaper->Tick();
  assert(report.reaped == 0);
  assert(f.registry->GetInstance(created.instance_id)->status == INSTANCE_STATUS_COMPLETED);
}

// A heartbeat landing after the scan but before the transition keeps the instance.
void TestHeartbeatAfterScanKeepsInstanceAlive() {
  Fixture f;
  auto    created = f.registry->CreateInstance("task-1", "list", "4242");
  f.processes->alive.insert("4242");
  f.Beat(created.instance_id, kT0);

  f.clock->SetMs(kT0 + 100 * kSecond);
  auto candidates = f.reaper->FindStale();
  assert(candidates.size() == 1);
  assert(candidates[0].instance_id == created.instance_id);

  f.Beat(created.instance_id, kT0 + 100 * kSecond);

  auto outcome = f.reaper->Reap(candidates[0]);
  assert(!outcome.reaped);
  assert(!outcome.signalled);
  assert(f.processes->terminated.empty());
  assert(f.registry->GetInstance(created.instance_id)->status == INSTANCE_STATUS_RUNNING);
  assert(f.query->GetTranscript(created.execution_id, 0, std::nullopt).entries_size() == 0);

  // a later heartbeat is still accepted
  f.Beat(created.instance_id, kT0 + 110 * kSecond);
}

// Heartbeat racing a tick: either the heartbeat lands and the instance lives,
// or the reap lands and the heartbeat is refused. Never both.
void TestHeartbeatRacingTickHasOneWinner() {
  for (int round = 0; round < 50; ++round) {
    Fixture f;
    auto    created = f.registry->CreateInstance("task-1", "list", "4242");
    f.processes->alive.insert("4242");
    f.Beat(created.instance_id, kT0);
    f.clock->SetMs(kT0 + 100 * kSecond);

    std::atomic<bool> beat_accepted{false};
    std::atomic<bool> beat_refused{false};
    std::atomic<int>  reaped{0};

    std::thread worker([&] {
      HeartbeatRequest req;
      req.set_instance_id(created.instance_id);
      *req.mutable_timestamp() = supervisor::util::MillisToProto(kT0 + 100 * kSecond);
      try {
        beat_accepted.store(f.ingest->Heartbeat(req).accepted());
      } catch (const supervisor::util::InstanceTerminated&) {
        beat_refused.store(true);
      }
    });
    std::thread ticker([&] { reaped.fetch_add(static_cast<int>(f.reaper->Tick().reaped)); });
    worker.join();
    ticker.join();

    const auto status = f.registry->GetInstance(created.instance_id)->status;
    if (reaped.load() == 1) {
      assert(beat_refused.load());
      assert(!beat_accepted.load());
      assert(status == INSTANCE_STATUS_TERMINATED);
      assert(f.processes->terminated.size() == 1);
    } else {
      assert(reaped.load() == 0);
      assert(beat_accepted.load());
      assert(status == INSTANCE_STATUS_RUNNING);
      assert(f.processes->terminated.empty());
    }
  }
}

void TestConcurrentTicksReapOnce() {
  for (int round = 0; round < 50; ++round) {
    Fixture f;
    auto    created = f.registry->CreateInstance("task-1", "list", "4242");
    f.processes->alive.insert("4242");
    f.Beat(created.instance_id, kT0);
    f.clock->SetMs(kT0 + 100 * kSecond);

    std::atomic<int> reaped{0};
    std::atomic<int> signalled{0};
    auto             tick = [&] {
      auto report = f.reaper->Tick();
      reaped.fetch_add(static_cast<int>(report.reaped));
      signalled.fetch_add(static_cast<int>(report.signalled));
    };

    std::thread first(tick);
    std::thread second(tick);
    first.join();
    second.join();

    assert(reaped.load() == 1);
    assert(signalled.load() == 1);
    assert(f.processes->terminated.size() == 1);

    auto transcript = f.query->GetTranscript(created.execution_id, 0, std::nullopt);
    assert(transcript.entries_size() == 1);
    assert(transcript.entries(0).category() == "reaped");
  }
}

void TestSignalDisabled() {
  Fixture f;
  f.options.signal_processes = false;
  f.reaper = std::make_unique<LivenessReaper>(f.registry, f.emitter, f.processes, f.liveness, f.options);

  auto created = f.registry->CreateInstance("task-1", "list", "99");
  f.processes->alive.insert("99");
  f.Beat(created.instance_id, kT0);

  f.clock->SetMs(kT0 + 100 * kSecond);
  auto report = f.reaper->Tick();
  assert(report.reaped == 1);
  assert(report.signalled == 0);
  assert(f.processes->terminated.empty());
}

void TestRepeatedScanFailuresDegrade() {
  Fixture f;
  f.repository->fail_scans = true;

  assert(!f.reaper->RunTick());
  assert(!f.reaper->RunTick());
  assert(f.reaper->ConsecutiveFailures() == 2);
  assert(!f.reaper->IsDegraded());

  assert(!f.reaper->RunTick());
  assert(f.reaper->IsDegraded());

  f.repository->fail_scans = false;
  assert(f.reaper->RunTick());
  assert(f.reaper->ConsecutiveFailures() == 0);
  assert(!f.reaper->IsDegraded());
}

void TestBackgroundLoopStartsAndStops() {
  Fixture f;
  f.options.tick_period_ms = 5;
  f.reaper = std::make_unique<LivenessReaper>(f.registry, f.emitter, f.processes, f.liveness, f.options);

  auto created = f.registry->CreateInstance("task-1", "list");
  f.Beat(created.instance_id, kT0);
  f.clock->SetMs(kT0 + 100 * kSecond);

  f.reaper->Start();
  for (int i = 0; i < 200; ++i) {
    if (f.registry->GetInstance(created.instance_id)->status == INSTANCE_STATUS_TERMINATED) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  f.reaper->Stop();

  assert(f.registry->GetInstance(created.instance_id)->status == INSTANCE_STATUS_TERMINATED);
}

} // namespace

int main() {
  TestSilentInstanceIsReaped();
  TestHealthyAndPendingInstancesAreLeftAlone();
  TestRunningWithoutHeartbeatUsesStartTime();
  TestWorkerReportWinsOverReaper();
  TestHeartbeatAfterScanKeepsInstanceAlive();
  TestHeartbeatRacingTickHasOneWinner();
  TestConcurrentTicksReapOnce();
  TestSignalDisabled();
  TestRepeatedScanFailuresDegrade();
  TestBackgroundLoopStartsAndStops();

  std::cout << "agent_supervisor_unit_liveness_reaper: pass\n";
  return 0;
}
