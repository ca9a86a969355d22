#pragma once

#include <atomic>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace supervisor::util {

/*
  Every timestamp the supervisor stores or compares is unix milliseconds,
  0 meaning unset. Components take a Clock so liveness decisions can be
  driven deterministically in tests.
*/
class Clock {
 public:
  virtual ~Clock() = default;

  virtual uint64_t NowMs() const = 0;
};

class WallClock final : public Clock {
 public:
  uint64_t NowMs() const override;
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint64_t start_ms = 0) : now_ms_(start_ms) {
  }

  uint64_t NowMs() const override {
    return now_ms_.load();
  }

  void SetMs(uint64_t ms) {
    now_ms_.store(ms);
  }
  void AdvanceMs(uint64_t ms) {
    now_ms_.fetch_add(ms);
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

// 0 maps to an empty Timestamp and back.
google::protobuf::Timestamp MillisToProto(uint64_t ms);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

} // namespace supervisor::util
