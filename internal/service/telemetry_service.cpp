#include "telemetry_service.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/telemetry/event_emitter.hpp"
#include "supervisor/v1.hpp"

namespace supervisor::service {

using namespace supervisor::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const EmitRequest& req, Fn&& fn) {
  supervisor::observability::SpanScope span(route);
  span.SetAttribute("execution.id", req.execution_id());
  span.SetAttribute("entry.type", EntryType_Name(req.entry_type()));

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    span.SetAttribute("entry.sequence", static_cast<std::int64_t>(result.sequence()));
    supervisor::observability::Metrics::Instance().RecordRequest(route, true);
    supervisor::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SUPERVISOR_LOG_ERROR("RPC failed", {supervisor::observability::StringField("route", route), supervisor::observability::StringField("error", ex.what()),
                                        supervisor::observability::StringField("execution_id", req.execution_id()),
                                        supervisor::observability::StringField("instance_id", req.instance_id())});
    supervisor::observability::Metrics::Instance().RecordRequest(route, false);
    supervisor::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

TelemetryService::TelemetryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

EmitResponse TelemetryService::Emit(const EmitRequest& req) {
  return ObserveRpc("TelemetryService.Emit", req, [&] { return ctx_.emitter->Emit(req, supervisor::telemetry::EmitOrigin::kWorker); });
}

} // namespace supervisor::service
