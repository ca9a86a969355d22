#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "event_emitter.hpp"
#include "internal/util/retry.hpp"

namespace supervisor::telemetry {

/*
  Caller-side resilience around an Emitter.

  - StoreUnavailable is retried with exponential backoff. Retries and
    their sleeps run on the caller's thread without any shared lock, so
    one execution's outage wait never delays another's emit.
  - When retries exhaust the request is queued locally, in order.
  - While an execution has anything queued (or a pending loss marker),
    its later emits queue behind it instead of overtaking.
  - The queue is re-drained before every later Emit and on Flush(), by
    one thread at a time, one store attempt per entry.
  - On overflow the oldest queued request is dropped and counted per
    execution; an error/dropped_events entry with the count is written
    once the store accepts writes again.

  Any other error is the caller's and propagates unchanged.
*/
class ResilientEmitter {
 public:
  ResilientEmitter(std::shared_ptr<Emitter> inner, supervisor::util::BackoffPolicy policy, std::size_t local_queue_capacity,
                   supervisor::util::Sleeper sleeper = supervisor::util::ThreadSleeper());

  // nullopt when the entry was queued locally instead of committed.
  std::optional<supervisor::services::v1::EmitResponse> Emit(const supervisor::services::v1::EmitRequest& req,
                                                             EmitOrigin origin = EmitOrigin::kWorker);

  // Drains as much of the local queue as the store accepts. Returns the
  // number of requests committed.
  std::size_t Flush();

  std::size_t QueuedCount() const;
  uint64_t    DroppedCount() const;

 private:
  struct Pending {
    supervisor::services::v1::EmitRequest req;
    EmitOrigin                            origin;
  };

  struct DroppedBatch {
    std::string instance_id;
    std::string task_id;
    uint64_t    count = 0;
  };

  enum class DrainResult { kDrained, kStoreDown, kBusy };

  std::optional<supervisor::services::v1::EmitResponse> EmitWithRetry(const supervisor::services::v1::EmitRequest& req, EmitOrigin origin);

  // kBusy only when wait is false and another thread is draining.
  DrainResult Drain(bool wait, std::size_t* committed);

  // Caller holds mutex_ for the *Locked helpers.
  bool HasPendingLocked(const std::string& execution_id) const;
  void EnqueueLocked(Pending pending, bool at_front = false);
  void TrimLocked();

  std::shared_ptr<Emitter>        inner_;
  supervisor::util::BackoffPolicy policy_;
  std::size_t                     capacity_;
  supervisor::util::Sleeper       sleeper_;

  std::mutex drain_mutex_;

  mutable std::mutex                  mutex_;
  std::deque<Pending>                 queue_;
  std::map<std::string, std::size_t>  queued_per_execution_;
  std::string                         in_flight_execution_; // entry the drainer is writing
  std::map<std::string, DroppedBatch> dropped_;             // by execution_id
  uint64_t                            dropped_total_ = 0;
};

} // namespace supervisor::telemetry
