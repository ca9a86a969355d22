#include "fanout.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/telemetry/transcript_codec.hpp"
#include "internal/util/errors.hpp"

namespace supervisor::stream {

using supervisor::core::v1::TranscriptEntry;
using supervisor::observability::IntField;
using supervisor::observability::StringField;

Subscription::Subscription(std::string execution_id, std::size_t capacity)
    : execution_id_(std::move(execution_id)), capacity_(capacity == 0 ? 1 : capacity) {
}

std::optional<supervisor::services::v1::SubscribeResponse> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return closed_ || !replay_.empty() || (!replaying_ && (!live_.empty() || gap_.has_value())); });

  supervisor::services::v1::SubscribeResponse response;
  if (!replay_.empty()) {
    *response.mutable_entry() = std::move(replay_.front());
    replay_.pop_front();
    return response;
  }
  if (replaying_) {
    return std::nullopt;
  }
  if (!live_.empty()) {
    *response.mutable_entry() = std::move(live_.front());
    live_.pop_front();
    return response;
  }
  if (gap_.has_value()) {
    *response.mutable_gap() = *gap_;
    gap_.reset();
    return response;
  }
  return std::nullopt;
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

bool Subscription::IsDrained() const {
  std::lock_guard lock(mutex_);
  return closed_ && replay_.empty() && (replaying_ || live_.empty()) && !gap_.has_value();
}

bool Subscription::PushLiveLocked(const TranscriptEntry& entry) {
  auto& last = last_sequence_[entry.execution_id()];
  if (entry.sequence() <= last) {
    return true;
  }

  if (live_.size() >= capacity_) {
    supervisor::core::v1::Gap gap;
    gap.set_execution_id(entry.execution_id());
    gap.set_last_delivered_sequence(last);
    gap.set_dropped(1);
    gap_    = std::move(gap);
    closed_ = true;
    return false;
  }

  last = entry.sequence();
  live_.push_back(entry);
  return true;
}

void Subscription::CountDroppedLocked(const TranscriptEntry& entry) {
  if (gap_.has_value() && entry.execution_id() == gap_->execution_id() && entry.sequence() > gap_->last_delivered_sequence()) {
    gap_->set_dropped(gap_->dropped() + 1);
  }
}

Subscription::OfferResult Subscription::Offer(const TranscriptEntry& entry) {
  OfferResult result = OfferResult::kQueued;
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      // still registered after an overflow during replay; the gap keeps counting
      CountDroppedLocked(entry);
      return OfferResult::kClosed;
    }
    if (replaying_) {
      pending_.push_back(entry);
      return OfferResult::kQueued;
    }
    if (!PushLiveLocked(entry)) {
      result = OfferResult::kOverflow;
    }
  }
  cv_.notify_all();
  return result;
}

void Subscription::FinishReplay(std::deque<TranscriptEntry> replay) {
  {
    std::lock_guard lock(mutex_);
    for (const auto& entry : replay) {
      auto& last = last_sequence_[entry.execution_id()];
      if (entry.sequence() > last) {
        last = entry.sequence();
      }
    }
    replay_    = std::move(replay);
    replaying_ = false;

    for (const auto& entry : pending_) {
      if (closed_) {
        CountDroppedLocked(entry);
      } else {
        PushLiveLocked(entry);
      }
    }
    pending_.clear();
  }
  cv_.notify_all();
}

StreamFanout::StreamFanout(std::shared_ptr<supervisor::db::Repository> repository, std::size_t subscriber_queue_capacity)
    : repository_(std::move(repository)), capacity_(subscriber_queue_capacity) {
}

std::shared_ptr<Subscription> StreamFanout::Subscribe(const std::string& execution_id, std::optional<uint64_t> from_sequence) {
  if (execution_id.empty()) {
    throw supervisor::util::InvalidArgument("subscribe: execution_id is required (use \"*\" for all executions)");
  }

  const bool wildcard = execution_id == kAllExecutions;
  auto       sub      = std::make_shared<Subscription>(execution_id, capacity_);

  if (!wildcard) {
    auto tx = repository_->Begin();
    if (!repository_->GetExecution(*tx, execution_id).has_value()) {
      throw supervisor::util::NotFound("subscribe: execution " + execution_id + " not found");
    }
    tx->Commit();
  }

  const bool replay = !wildcard && from_sequence.has_value();
  if (replay) {
    std::lock_guard sub_lock(sub->mutex_);
    sub->replaying_ = true;
  }

  // Register before reading the store so no commit falls between the
  // replay snapshot and the live feed; duplicates are dropped by sequence.
  {
    std::lock_guard lock(mutex_);
    subscribers_[execution_id].insert(sub);
  }

  if (replay) {
    std::deque<TranscriptEntry> backlog;
    try {
      auto       tx      = repository_->Begin();
      const auto records = repository_->ReadTranscript(*tx, execution_id, *from_sequence, std::nullopt);
      tx->Commit();
      for (const auto& record : records) {
        backlog.push_back(supervisor::telemetry::ToProto(record));
      }
    } catch (const std::exception&) {
      Unsubscribe(sub);
      throw;
    }
    sub->FinishReplay(std::move(backlog));
  }

  SUPERVISOR_LOG_DEBUG("Subscriber attached", {StringField("execution_id", execution_id),
                                              IntField("from_sequence", static_cast<int64_t>(from_sequence.value_or(0)))});
  return sub;
}

void StreamFanout::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  if (!subscription) {
    return;
  }
  subscription->Close();

  std::lock_guard lock(mutex_);
  auto            it = subscribers_.find(subscription->ExecutionId());
  if (it == subscribers_.end()) {
    return;
  }
  it->second.erase(subscription);
  if (it->second.empty()) {
    subscribers_.erase(it);
  }
}

void StreamFanout::DeliverLocked(const std::string& key, const TranscriptEntry& entry, std::vector<std::shared_ptr<Subscription>>* overflowed) {
  const auto it = subscribers_.find(key);
  if (it == subscribers_.end()) {
    return;
  }

  for (auto sub_it = it->second.begin(); sub_it != it->second.end();) {
    switch ((*sub_it)->Offer(entry)) {
      case Subscription::OfferResult::kQueued:
        ++sub_it;
        break;
      case Subscription::OfferResult::kOverflow:
        overflowed->push_back(*sub_it);
        sub_it = it->second.erase(sub_it);
        break;
      case Subscription::OfferResult::kClosed:
        sub_it = it->second.erase(sub_it);
        break;
    }
  }
  if (it->second.empty()) {
    subscribers_.erase(it);
  }
}

void StreamFanout::Publish(const TranscriptEntry& entry) {
  std::vector<std::shared_ptr<Subscription>> overflowed;
  {
    std::lock_guard lock(mutex_);
    DeliverLocked(entry.execution_id(), entry, &overflowed);
    DeliverLocked(kAllExecutions, entry, &overflowed);
  }

  for (const auto& sub : overflowed) {
    SUPERVISOR_LOG_WARN("Slow subscriber disconnected", {StringField("subscription", sub->ExecutionId()),
                                                         StringField("execution_id", entry.execution_id()),
                                                         IntField("sequence", static_cast<int64_t>(entry.sequence()))});
    supervisor::observability::Metrics::Instance().RecordSubscriberDisconnect("slow_consumer");
  }
}

std::size_t StreamFanout::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  std::size_t     count = 0;
  for (const auto& [_, subs] : subscribers_) {
    count += subs.size();
  }
  return count;
}

} // namespace supervisor::stream
