#include "supervisor_options.hpp"

#include <cmath>
#include <stdexcept>

namespace supervisor::config {

uint64_t LivenessOptions::StaleTimeoutMs() const {
  return static_cast<uint64_t>(std::llround(static_cast<double>(heartbeat_interval_ms) * stale_timeout_multiplier));
}

SupervisorOptions ResolveOptions(const supervisor::runtime::config::RuntimeConfig& config) {
  SupervisorOptions options;

  if (!config.server().bind_address().empty()) {
    options.bind_address = config.server().bind_address();
  }

  const auto& liveness = config.liveness();
  if (liveness.heartbeat_interval_ms() != 0) {
    options.liveness.heartbeat_interval_ms = liveness.heartbeat_interval_ms();
  }
  if (liveness.stale_timeout_multiplier() != 0.0) {
    if (liveness.stale_timeout_multiplier() < 1.0) {
      throw std::invalid_argument("liveness.stale_timeout_multiplier must be >= 1");
    }
    options.liveness.stale_timeout_multiplier = liveness.stale_timeout_multiplier();
  }
  options.liveness.record_heartbeat_entries = liveness.record_heartbeat_entries();

  const auto& reaper = config.reaper();
  if (reaper.has_enabled()) options.reaper.enabled = reaper.enabled();
  if (reaper.has_signal_processes()) options.reaper.signal_processes = reaper.signal_processes();
  if (reaper.tick_period_ms() != 0) options.reaper.tick_period_ms = reaper.tick_period_ms();
  if (reaper.alert_after_failures() != 0) options.reaper.alert_after_failures = reaper.alert_after_failures();

  const auto& retry = config.store_retry();
  if (retry.max_attempts() != 0) options.store_retry.max_attempts = retry.max_attempts();
  if (retry.initial_backoff_ms() != 0) options.store_retry.initial_backoff_ms = retry.initial_backoff_ms();
  if (retry.max_backoff_ms() != 0) options.store_retry.max_backoff_ms = retry.max_backoff_ms();
  if (retry.backoff_multiplier() != 0.0) {
    if (retry.backoff_multiplier() < 1.0) {
      throw std::invalid_argument("store_retry.backoff_multiplier must be >= 1");
    }
    options.store_retry.backoff_multiplier = retry.backoff_multiplier();
  }
  if (retry.operation_timeout_ms() != 0) options.store_retry.operation_timeout_ms = retry.operation_timeout_ms();
  if (retry.local_queue_capacity() != 0) options.store_retry.local_queue_capacity = retry.local_queue_capacity();

  const auto& stream = config.stream();
  if (stream.subscriber_queue_capacity() != 0) options.stream.subscriber_queue_capacity = stream.subscriber_queue_capacity();
  if (stream.poll_interval_ms() != 0) options.stream.poll_interval_ms = stream.poll_interval_ms();

  if (options.store_retry.initial_backoff_ms > options.store_retry.max_backoff_ms) {
    throw std::invalid_argument("store_retry.initial_backoff_ms exceeds max_backoff_ms");
  }

  if (options.reaper.enabled && options.reaper.tick_period_ms >= options.liveness.StaleTimeoutMs()) {
    throw std::invalid_argument("reaper.tick_period_ms must be shorter than the stale timeout (" +
                                std::to_string(options.liveness.StaleTimeoutMs()) + " ms)");
  }

  return options;
}

} // namespace supervisor::config
