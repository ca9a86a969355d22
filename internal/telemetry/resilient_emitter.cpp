#include "resilient_emitter.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "supervisor/v1.hpp"

namespace supervisor::telemetry {

using namespace supervisor::v1;
using supervisor::observability::IntField;
using supervisor::observability::StringField;

namespace {

EmitRequest MakeLossMarker(const std::string& execution_id, const std::string& instance_id, const std::string& task_id, uint64_t count) {
  EmitRequest marker;
  marker.set_execution_id(execution_id);
  marker.set_instance_id(instance_id);
  marker.set_task_id(task_id);
  marker.set_entry_type(ENTRY_TYPE_ERROR);
  marker.set_category("dropped_events");
  marker.set_summary(std::to_string(count) + " transcript entries dropped while the store was unavailable");
  (*marker.mutable_payload()->mutable_fields())["dropped_count"].set_number_value(static_cast<double>(count));
  return marker;
}

} // namespace

ResilientEmitter::ResilientEmitter(std::shared_ptr<Emitter> inner, supervisor::util::BackoffPolicy policy, std::size_t local_queue_capacity,
                                   supervisor::util::Sleeper sleeper)
    : inner_(std::move(inner)),
      policy_(policy),
      capacity_(local_queue_capacity == 0 ? 1 : local_queue_capacity),
      sleeper_(sleeper ? std::move(sleeper) : supervisor::util::ThreadSleeper()) {
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
}

std::optional<EmitResponse> ResilientEmitter::EmitWithRetry(const EmitRequest& req, EmitOrigin origin) {
  for (uint32_t attempt = 0; attempt < policy_.max_attempts; ++attempt) {
    const auto delay_ms = supervisor::util::BackoffDelayMs(policy_, attempt);
    if (delay_ms > 0) {
      sleeper_(std::chrono::milliseconds(delay_ms));
    }
    try {
      return inner_->Emit(req, origin);
    } catch (const supervisor::util::StoreUnavailable& ex) {
      SUPERVISOR_LOG_DEBUG("Emit retry", {StringField("execution_id", req.execution_id()), IntField("attempt", attempt + 1),
                                          StringField("error", ex.what())});
    }
  }
  return std::nullopt;
}

bool ResilientEmitter::HasPendingLocked(const std::string& execution_id) const {
  return queued_per_execution_.count(execution_id) > 0 || dropped_.count(execution_id) > 0 || in_flight_execution_ == execution_id;
}

void ResilientEmitter::EnqueueLocked(Pending pending, bool at_front) {
  ++queued_per_execution_[pending.req.execution_id()];
  if (at_front) {
    queue_.push_front(std::move(pending));
  } else {
    queue_.push_back(std::move(pending));
  }
  TrimLocked();
}

void ResilientEmitter::TrimLocked() {
  while (queue_.size() > capacity_) {
    const auto& oldest = queue_.front().req;
    auto&       batch  = dropped_[oldest.execution_id()];
    batch.instance_id  = oldest.instance_id();
    batch.task_id      = oldest.task_id();
    ++batch.count;
    ++dropped_total_;

    SUPERVISOR_LOG_WARN("Local emit queue full; dropping oldest entry",
                        {StringField("execution_id", oldest.execution_id()), IntField("dropped", static_cast<int64_t>(batch.count))});
    supervisor::observability::Metrics::Instance().RecordEmitterDroppedEvents(1);

    auto it = queued_per_execution_.find(oldest.execution_id());
    if (it != queued_per_execution_.end() && --it->second == 0) {
      queued_per_execution_.erase(it);
    }
    queue_.pop_front();
  }
}

ResilientEmitter::DrainResult ResilientEmitter::Drain(bool wait, std::size_t* committed) {
  std::unique_lock<std::mutex> drain_lock(drain_mutex_, std::defer_lock);
  if (wait) {
    drain_lock.lock();
  } else if (!drain_lock.try_lock()) {
    return DrainResult::kBusy;
  }

  for (;;) {
    Pending  next;
    bool     is_marker    = false;
    uint64_t marker_count = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      // loss markers first, so readers learn about the hole before newer entries
      if (!dropped_.empty()) {
        const auto& [execution_id, batch] = *dropped_.begin();
        next         = {MakeLossMarker(execution_id, batch.instance_id, batch.task_id, batch.count), EmitOrigin::kSupervisor};
        is_marker    = true;
        marker_count = batch.count;
      } else if (!queue_.empty()) {
        next = std::move(queue_.front());
        queue_.pop_front();
        auto it = queued_per_execution_.find(next.req.execution_id());
        if (it != queued_per_execution_.end() && --it->second == 0) {
          queued_per_execution_.erase(it);
        }
      } else {
        return DrainResult::kDrained;
      }
      in_flight_execution_ = next.req.execution_id();
    }

    bool store_down = false;
    try {
      inner_->Emit(next.req, next.origin);
      ++*committed;
    } catch (const supervisor::util::StoreUnavailable&) {
      store_down = true;
    } catch (const std::exception& ex) {
      // not retryable, e.g. the instance went terminal meanwhile
      SUPERVISOR_LOG_WARN(is_marker ? "Dropped-events marker rejected" : "Queued emit rejected",
                          {StringField("execution_id", next.req.execution_id()), StringField("error", ex.what())});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_execution_.clear();
    if (store_down) {
      if (!is_marker) {
        EnqueueLocked(std::move(next), true);
      }
      return DrainResult::kStoreDown;
    }
    if (is_marker) {
      // entries dropped while the marker was being written stay counted
      auto it = dropped_.find(next.req.execution_id());
      if (it != dropped_.end()) {
        if (it->second.count <= marker_count) {
          dropped_.erase(it);
        } else {
          it->second.count -= marker_count;
        }
      }
    }
  }
}

std::optional<EmitResponse> ResilientEmitter::Emit(const EmitRequest& req, EmitOrigin origin) {
  std::size_t committed  = 0;
  const bool  store_down = Drain(false, &committed) == DrainResult::kStoreDown;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    // keep order: nothing overtakes what this execution already has queued
    if (store_down || HasPendingLocked(req.execution_id())) {
      EnqueueLocked({req, origin});
      return std::nullopt;
    }
  }

  auto resp = EmitWithRetry(req, origin);
  if (!resp.has_value()) {
    std::lock_guard<std::mutex> lock(mutex_);
    SUPERVISOR_LOG_WARN("Store unavailable; emit queued locally", {StringField("execution_id", req.execution_id()),
                                                                    IntField("queued", static_cast<int64_t>(queue_.size() + 1))});
    EnqueueLocked({req, origin});
  }
  return resp;
}

std::size_t ResilientEmitter::Flush() {
  std::size_t committed = 0;
  Drain(true, &committed);
  return committed;
}

std::size_t ResilientEmitter::QueuedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

uint64_t ResilientEmitter::DroppedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_total_;
}

} // namespace supervisor::telemetry
