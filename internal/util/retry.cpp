#include "retry.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace supervisor::util {

uint64_t BackoffDelayMs(const BackoffPolicy& policy, uint32_t attempt) {
  if (attempt == 0 || policy.initial_backoff_ms == 0) {
    return 0;
  }

  const double exponential = static_cast<double>(policy.initial_backoff_ms) * std::pow(std::max(policy.multiplier, 1.0), attempt - 1);
  const auto   capped      = static_cast<uint64_t>(std::min(exponential, static_cast<double>(policy.max_backoff_ms)));
  if (policy.jitter_pct == 0) {
    return capped;
  }

  static thread_local std::mt19937 gen{std::random_device{}()};
  const int                        pct = static_cast<int>(std::min<uint32_t>(policy.jitter_pct, 100));
  std::uniform_int_distribution<>  dis(-pct, pct);

  const auto jitter = static_cast<int64_t>(capped) * dis(gen) / 100;
  return static_cast<uint64_t>(std::max<int64_t>(0, static_cast<int64_t>(capped) + jitter));
}

Sleeper ThreadSleeper() {
  return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

} // namespace supervisor::util
