#pragma once

#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "supervisor/core/v1/types.pb.h"

namespace supervisor::registry {

struct CreatedInstance {
  std::string instance_id;
  std::string execution_id;
};

struct TerminalTransition {
  // false when the same (status, reason) had already been committed
  bool                                applied = false;
  supervisor::db::model::InstanceRecord instance;
  // execution closed by the transition; set only when applied
  std::string execution_id;
};

/*
  Owner of instance status.

  Every status change is a compare-and-swap on the stored version, taken
  under the per-instance shard lock so that local callers serialize and
  remote writers (another supervisor on the same store) surface as
  Conflict and are re-evaluated against the committed row.
*/
class InstanceRegistry {
 public:
  InstanceRegistry(std::shared_ptr<supervisor::db::Repository> repository, std::shared_ptr<supervisor::util::Clock> clock);

  CreatedInstance CreateInstance(const std::string& task_id, const std::string& task_list_id, const std::string& pid = {},
                                 const std::string& hostname = {});

  supervisor::db::model::InstanceRecord MarkRunning(const std::string& instance_id);

  TerminalTransition MarkTerminal(const std::string& instance_id, supervisor::core::v1::InstanceStatus status, const std::string& reason);

  // terminated/<reason>, but only while the row re-read under the instance
  // lock is still a running instance silent for more than stale_timeout_ms.
  // nullopt when a heartbeat or a terminal report got there first.
  std::optional<TerminalTransition> MarkTerminalIfStale(const std::string& instance_id, uint64_t stale_timeout_ms, const std::string& reason);

  // Empty hostname keeps the stored one.
  supervisor::db::model::InstanceRecord AttachProcess(const std::string& instance_id, const std::string& pid,
                                                      const std::string& hostname = {});

  std::optional<supervisor::db::model::InstanceRecord> GetInstance(const std::string& instance_id);

  // Shard lock shared with HeartbeatIngest; taken before any repository transaction.
  std::unique_lock<std::mutex> LockInstance(const std::string& instance_id);

  supervisor::db::Repository& Store() { return *repository_; }
  uint64_t NowMs() const { return clock_->NowMs(); }

 private:
  static constexpr std::size_t kInstanceLockShardCount = 64;
  static constexpr int         kMaxCasAttempts         = 8;

  using TransitionGuard = std::function<bool(const supervisor::db::model::InstanceRecord& current, uint64_t now_ms)>;

  std::size_t InstanceShardIndex(const std::string& instance_id) const;

  // nullopt only when guard rejects the current row.
  std::optional<TerminalTransition> CommitTerminal(const std::string& instance_id, supervisor::core::v1::InstanceStatus status,
                                                   const std::string& reason, const TransitionGuard& guard);

  std::shared_ptr<supervisor::db::Repository> repository_;
  std::shared_ptr<supervisor::util::Clock>    clock_;

  std::array<std::mutex, kInstanceLockShardCount> instance_mu_;
};

} // namespace supervisor::registry
