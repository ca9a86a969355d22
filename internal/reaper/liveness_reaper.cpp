#include "liveness_reaper.hpp"

#include <chrono>

#include "internal/heartbeat/liveness.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reaper/process_controller.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/telemetry/resilient_emitter.hpp"
#include "supervisor/v1.hpp"

namespace supervisor::reaper {

using namespace supervisor::v1;
using supervisor::observability::IntField;
using supervisor::observability::StringField;

namespace {

constexpr const char* kStaleReason = "stale_heartbeat";

} // namespace

LivenessReaper::LivenessReaper(std::shared_ptr<supervisor::registry::InstanceRegistry> registry,
                               std::shared_ptr<supervisor::telemetry::ResilientEmitter> emitter, std::shared_ptr<ProcessController> processes,
                               supervisor::config::LivenessOptions liveness, supervisor::config::ReaperOptions options)
    : registry_(std::move(registry)),
      emitter_(std::move(emitter)),
      processes_(std::move(processes)),
      liveness_(liveness),
      options_(options) {
}

LivenessReaper::~LivenessReaper() {
  Stop();
}

void LivenessReaper::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&LivenessReaper::Run, this);
  SUPERVISOR_LOG_INFO("Liveness reaper started", {IntField("tick_period_ms", static_cast<int64_t>(options_.tick_period_ms)),
                                                  IntField("stale_timeout_ms", static_cast<int64_t>(liveness_.StaleTimeoutMs()))});
}

void LivenessReaper::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void LivenessReaper::Run() {
  while (running_) {
    RunTick();

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, std::chrono::milliseconds(options_.tick_period_ms), [&] { return !running_; });
  }
}

std::vector<supervisor::db::model::InstanceRecord> LivenessReaper::FindStale() {
  const auto now_ms     = registry_->NowMs();
  const auto timeout_ms = liveness_.StaleTimeoutMs();

  supervisor::db::InstanceFilter filter;
  filter.statuses            = {INSTANCE_STATUS_RUNNING};
  filter.heartbeat_before_ms = now_ms > timeout_ms ? now_ms - timeout_ms : 0;

  std::vector<supervisor::db::model::InstanceRecord> candidates;
  {
    auto& repo = registry_->Store();
    auto  tx   = repo.Begin();
    candidates = repo.ListInstances(*tx, filter);
    tx->Commit();
  }

  std::vector<supervisor::db::model::InstanceRecord> stale;
  for (auto& instance : candidates) {
    if (supervisor::heartbeat::IsStale(instance, now_ms, timeout_ms)) {
      stale.push_back(std::move(instance));
    }
  }
  return stale;
}

ReapOutcome LivenessReaper::Reap(const supervisor::db::model::InstanceRecord& candidate) {
  const auto timeout_ms = liveness_.StaleTimeoutMs();

  ReapOutcome outcome;
  auto        transition = registry_->MarkTerminalIfStale(candidate.instance_id, timeout_ms, kStaleReason);
  if (!transition.has_value() || !transition->applied) {
    SUPERVISOR_LOG_DEBUG("Reap skipped; instance no longer stale", {StringField("instance_id", candidate.instance_id)});
    return outcome;
  }
  outcome.reaped = true;

  const auto& instance   = transition->instance;
  const auto  silence_ms = supervisor::heartbeat::SilenceMs(instance, instance.terminated_at_ms);

  if (options_.signal_processes && processes_ && !instance.pid.empty()) {
    outcome.signalled = processes_->IsAlive(instance.pid) && processes_->Terminate(instance.pid);
  }

  SUPERVISOR_LOG_WARN("Reaped stale instance", {StringField("instance_id", instance.instance_id), StringField("task_id", instance.task_id),
                                                StringField("pid", instance.pid), IntField("silence_ms", static_cast<int64_t>(silence_ms))});

  if (!emitter_ || transition->execution_id.empty()) {
    return outcome;
  }

  EmitRequest entry;
  entry.set_execution_id(transition->execution_id);
  entry.set_instance_id(instance.instance_id);
  entry.set_task_id(instance.task_id);
  entry.set_entry_type(ENTRY_TYPE_LIFECYCLE);
  entry.set_category("reaped");
  entry.set_summary("instance terminated: no heartbeat within " + std::to_string(timeout_ms) + " ms");
  auto& fields = *entry.mutable_payload()->mutable_fields();
  fields["reason"].set_string_value(kStaleReason);
  fields["silence_ms"].set_number_value(static_cast<double>(silence_ms));
  fields["timeout_ms"].set_number_value(static_cast<double>(timeout_ms));
  if (!instance.pid.empty()) {
    fields["pid"].set_string_value(instance.pid);
  }
  emitter_->Emit(entry, supervisor::telemetry::EmitOrigin::kSupervisor);
  return outcome;
}

TickReport LivenessReaper::Tick() {
  TickReport report;
  for (const auto& candidate : FindStale()) {
    ++report.stale;
    const auto outcome = Reap(candidate);
    report.reaped += outcome.reaped ? 1 : 0;
    report.signalled += outcome.signalled ? 1 : 0;
  }

  supervisor::observability::Metrics::Instance().RecordInstancesReaped(report.reaped);
  return report;
}

bool LivenessReaper::RunTick() {
  const auto started_at = std::chrono::steady_clock::now();
  supervisor::observability::SpanScope span("LivenessReaper.Tick");

  bool ok = true;
  try {
    const auto report = Tick();
    span.SetAttribute("reaper.reaped", static_cast<int64_t>(report.reaped));
    if (report.stale > 0) {
      SUPERVISOR_LOG_DEBUG("Reaper tick", {IntField("stale", report.stale), IntField("reaped", report.reaped), IntField("signalled", report.signalled)});
    }
  } catch (const std::exception& ex) {
    ok = false;
    span.RecordException(ex.what());

    const auto failures = ++consecutive_failures_;
    if (options_.alert_after_failures > 0 && failures >= options_.alert_after_failures) {
      if (!degraded_.exchange(true)) {
        supervisor::observability::Metrics::Instance().SetReaperDegraded(true);
      }
      SUPERVISOR_LOG_ERROR("Liveness reaper degraded", {IntField("consecutive_failures", failures), StringField("error", ex.what())});
    } else {
      SUPERVISOR_LOG_WARN("Reaper tick failed; retrying next tick", {IntField("consecutive_failures", failures), StringField("error", ex.what())});
    }
  }

  if (ok) {
    consecutive_failures_ = 0;
    if (degraded_.exchange(false)) {
      supervisor::observability::Metrics::Instance().SetReaperDegraded(false);
      SUPERVISOR_LOG_INFO("Liveness reaper recovered");
    }
  }

  supervisor::observability::Metrics::Instance().ObserveReaperTickMs(
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  return ok;
}

} // namespace supervisor::reaper
