#pragma once

#include <array>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "supervisor/services/v1/supervisor_telemetry_service.pb.h"

namespace supervisor::stream {
class StreamFanout;
}

namespace supervisor::telemetry {

enum class EmitOrigin {
  kWorker,
  // lifecycle records written by the supervisor itself; allowed after the
  // instance went terminal
  kSupervisor,
};

// Write seam for transcript entries; ResilientEmitter decorates it.
class Emitter {
 public:
  virtual ~Emitter() = default;

  virtual supervisor::services::v1::EmitResponse Emit(const supervisor::services::v1::EmitRequest& req,
                                                      EmitOrigin origin = EmitOrigin::kWorker) = 0;
};

/*
  The single telemetry write path.

  Per execution, Emit is serialized through a striped lock; the sequence
  is assigned by the store inside the transaction, projections for
  tool_use and assertion entries are written in the same transaction, and
  the committed entry is handed to the fan-out before the lock is released.
*/
class EventEmitter final : public Emitter {
 public:
  EventEmitter(std::shared_ptr<supervisor::db::Repository> repository, std::shared_ptr<supervisor::stream::StreamFanout> fanout,
               std::shared_ptr<supervisor::util::Clock> clock);

  supervisor::services::v1::EmitResponse Emit(const supervisor::services::v1::EmitRequest& req,
                                              EmitOrigin origin = EmitOrigin::kWorker) override;

 private:
  static constexpr std::size_t kExecutionLockShardCount = 64;

  std::mutex& ExecutionShard(const std::string& execution_id);

  std::shared_ptr<supervisor::db::Repository>        repository_;
  std::shared_ptr<supervisor::stream::StreamFanout> fanout_;
  std::shared_ptr<supervisor::util::Clock>           clock_;

  std::array<std::mutex, kExecutionLockShardCount> execution_mu_;
};

} // namespace supervisor::telemetry
