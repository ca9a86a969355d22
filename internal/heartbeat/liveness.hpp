#pragma once

#include <cstdint>

#include "internal/db/model/instance_record.hpp"

namespace supervisor::heartbeat {

// Point from which heartbeat silence is measured: the last accepted
// heartbeat, or creation time for an instance that never sent one.
inline uint64_t LivenessBaselineMs(const supervisor::db::model::InstanceRecord& record) {
  return record.last_heartbeat_at_ms != 0 ? record.last_heartbeat_at_ms : record.started_at_ms;
}

inline uint64_t SilenceMs(const supervisor::db::model::InstanceRecord& record, uint64_t now_ms) {
  const auto baseline = LivenessBaselineMs(record);
  return now_ms > baseline ? now_ms - baseline : 0;
}

inline bool IsStale(const supervisor::db::model::InstanceRecord& record, uint64_t now_ms, uint64_t timeout_ms) {
  return record.status == supervisor::core::v1::INSTANCE_STATUS_RUNNING && SilenceMs(record, now_ms) > timeout_ms;
}

} // namespace supervisor::heartbeat
