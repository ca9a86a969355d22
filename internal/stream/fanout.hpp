#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "supervisor/services/v1/supervisor_query_service.pb.h"

namespace supervisor::stream {

inline constexpr const char* kAllExecutions = "*";

/*
  One live subscriber.

  Replayed entries are delivered first, then live entries. Only live
  entries count against the queue capacity; when it overflows the
  subscriber receives a Gap and is closed instead of blocking publishers.
*/
class Subscription {
 public:
  Subscription(std::string execution_id, std::size_t capacity);

  // nullopt on timeout or once closed and drained.
  std::optional<supervisor::services::v1::SubscribeResponse> Next(std::chrono::milliseconds timeout);

  void Close();
  bool IsClosed() const;

  // true once closed and every queued event has been handed out
  bool IsDrained() const;

  const std::string& ExecutionId() const { return execution_id_; }

 private:
  friend class StreamFanout;

  enum class OfferResult { kQueued, kOverflow, kClosed };

  OfferResult Offer(const supervisor::core::v1::TranscriptEntry& entry);

  // Installs the replay backlog and releases entries published meanwhile.
  void FinishReplay(std::deque<supervisor::core::v1::TranscriptEntry> replay);

  bool PushLiveLocked(const supervisor::core::v1::TranscriptEntry& entry);
  void CountDroppedLocked(const supervisor::core::v1::TranscriptEntry& entry);

  const std::string execution_id_;
  const std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  bool replaying_ = false;
  bool closed_    = false;

  std::deque<supervisor::core::v1::TranscriptEntry> pending_; // published during replay
  std::deque<supervisor::core::v1::TranscriptEntry> replay_;
  std::deque<supervisor::core::v1::TranscriptEntry> live_;
  std::optional<supervisor::core::v1::Gap>          gap_;

  // highest sequence queued per execution
  std::unordered_map<std::string, uint64_t> last_sequence_;
};

/*
  Pushes committed transcript entries to subscribers in commit order.

  Publish is called by the emission façade while it still holds the
  execution lock, so per execution it sees entries in sequence order.
*/
class StreamFanout {
 public:
  StreamFanout(std::shared_ptr<supervisor::db::Repository> repository, std::size_t subscriber_queue_capacity);

  // execution_id "*" receives live entries of every execution; replay is
  // ignored for it. Throws util::NotFound for an unknown execution.
  std::shared_ptr<Subscription> Subscribe(const std::string& execution_id, std::optional<uint64_t> from_sequence);

  void Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  void Publish(const supervisor::core::v1::TranscriptEntry& entry);

  std::size_t SubscriberCount() const;

 private:
  void DeliverLocked(const std::string& key, const supervisor::core::v1::TranscriptEntry& entry,
                     std::vector<std::shared_ptr<Subscription>>* overflowed);

  std::shared_ptr<supervisor::db::Repository> repository_;
  const std::size_t                           capacity_;

  mutable std::mutex                                                                   mutex_;
  std::unordered_map<std::string, std::unordered_set<std::shared_ptr<Subscription>>> subscribers_;
};

} // namespace supervisor::stream
