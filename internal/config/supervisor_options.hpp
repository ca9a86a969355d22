#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace supervisor::config {

/*
  Resolved runtime policy.

  Every zero/unset field of RuntimeConfig is replaced by its default here,
  so components never see a half-filled proto.
*/

struct LivenessOptions {
  uint64_t heartbeat_interval_ms    = 30'000;
  double   stale_timeout_multiplier = 3.0;
  bool     record_heartbeat_entries = false;

  // now - last_heartbeat_at beyond this marks a running instance stale.
  uint64_t StaleTimeoutMs() const;
};

struct ReaperOptions {
  bool     enabled              = true;
  uint64_t tick_period_ms       = 10'000;
  bool     signal_processes     = true;
  uint32_t alert_after_failures = 5;
};

struct StoreRetryOptions {
  uint32_t max_attempts         = 5;
  uint64_t initial_backoff_ms   = 100;
  uint64_t max_backoff_ms       = 5'000;
  double   backoff_multiplier   = 2.0;
  uint64_t operation_timeout_ms = 5'000;
  uint32_t local_queue_capacity = 1'024;
};

struct StreamOptions {
  uint32_t subscriber_queue_capacity = 1'024;
  uint64_t poll_interval_ms          = 500;
};

struct SupervisorOptions {
  std::string       bind_address = "0.0.0.0:50061";
  LivenessOptions   liveness;
  ReaperOptions     reaper;
  StoreRetryOptions store_retry;
  StreamOptions     stream;
};

// Throws std::invalid_argument when the reaper period is not shorter
// than the stale timeout or a multiplier is out of range.
SupervisorOptions ResolveOptions(const supervisor::runtime::config::RuntimeConfig& config);

} // namespace supervisor::config
