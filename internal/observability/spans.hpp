#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace supervisor::runtime::config {
class RuntimeConfig;
}

namespace supervisor::observability {

// Both return false when the signal is disabled in config or the build has
// no OpenTelemetry; the span and metric calls below are no-ops then.
bool InitializeTracing(const supervisor::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const supervisor::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveReaperTickMs(double duration_ms);
  void RecordInstancesReaped(std::uint64_t count);
  void SetReaperDegraded(bool degraded);
  void RecordSubscriberDisconnect(std::string_view reason);
  void RecordEmitterDroppedEvents(std::uint64_t count);
  void RecordHeartbeat(bool accepted);
  void RecordEntryCommitted(std::string_view entry_type);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const supervisor::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const supervisor::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveReaperTickMs(double) {
}

inline void Metrics::RecordInstancesReaped(std::uint64_t) {
}

inline void Metrics::SetReaperDegraded(bool) {
}

inline void Metrics::RecordSubscriberDisconnect(std::string_view) {
}

inline void Metrics::RecordEmitterDroppedEvents(std::uint64_t) {
}

inline void Metrics::RecordHeartbeat(bool) {
}

inline void Metrics::RecordEntryCommitted(std::string_view) {
}
#endif

} // namespace supervisor::observability
