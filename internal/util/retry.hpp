#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace supervisor::util {

/*
  Exponential backoff with jitter.

  attempt is 0-based: attempt 0 has no delay, attempt n waits
  initial * multiplier^(n-1), capped at max, then jittered by +/- jitter_pct.
*/

struct BackoffPolicy {
  uint32_t max_attempts       = 5;
  uint64_t initial_backoff_ms = 100;
  uint64_t max_backoff_ms     = 5'000;
  double   multiplier         = 2.0;
  uint32_t jitter_pct         = 20;
};

uint64_t BackoffDelayMs(const BackoffPolicy& policy, uint32_t attempt);

// Sleep hook so tests can run retry loops without wall-clock delay.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper ThreadSleeper();

} // namespace supervisor::util
