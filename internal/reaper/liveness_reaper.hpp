#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/config/supervisor_options.hpp"
#include "internal/db/model/instance_record.hpp"

namespace supervisor::registry {
class InstanceRegistry;
}
namespace supervisor::telemetry {
class ResilientEmitter;
}

namespace supervisor::reaper {

class ProcessController;

struct TickReport {
  uint32_t stale      = 0;
  uint32_t reaped     = 0; // fresh transitions committed by this tick
  uint32_t signalled  = 0;
};

struct ReapOutcome {
  bool reaped    = false;
  bool signalled = false;
};

/*
  Background loop demoting running instances whose heartbeat went silent
  beyond the stale timeout to terminated/stale_heartbeat.

  A scan only nominates candidates. Each one is demoted through
  InstanceRegistry::MarkTerminalIfStale, which re-checks staleness on the
  current row under the instance lock, so a heartbeat that lands after the
  scan keeps the instance alive. Concurrent or repeated ticks commit at
  most one demotion per instance. The process is signalled only after the
  demotion committed.
*/
class LivenessReaper {
 public:
  LivenessReaper(std::shared_ptr<supervisor::registry::InstanceRegistry> registry, std::shared_ptr<supervisor::telemetry::ResilientEmitter> emitter,
                 std::shared_ptr<ProcessController> processes, supervisor::config::LivenessOptions liveness,
                 supervisor::config::ReaperOptions options);
  ~LivenessReaper();

  void Start();
  void Stop();

  // One scan plus a Reap() per candidate. Throws when the store cannot be scanned.
  TickReport Tick();

  // Running instances that looked stale at scan time.
  std::vector<supervisor::db::model::InstanceRecord> FindStale();

  // Demotes one scanned candidate if it is still stale.
  ReapOutcome Reap(const supervisor::db::model::InstanceRecord& candidate);

  // Tick() with failure accounting; used by the background loop.
  bool RunTick();

  bool     IsDegraded() const { return degraded_.load(); }
  uint32_t ConsecutiveFailures() const { return consecutive_failures_.load(); }

 private:
  void Run();

  std::shared_ptr<supervisor::registry::InstanceRegistry>    registry_;
  std::shared_ptr<supervisor::telemetry::ResilientEmitter> emitter_;
  std::shared_ptr<ProcessController>                         processes_;
  supervisor::config::LivenessOptions                        liveness_;
  supervisor::config::ReaperOptions                          options_;

  std::atomic<uint32_t> consecutive_failures_{0};
  std::atomic<bool>     degraded_{false};

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
};

} // namespace supervisor::reaper
