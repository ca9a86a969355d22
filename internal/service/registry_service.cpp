#include "registry_service.hpp"

#include <chrono>
#include <type_traits>

#include "internal/heartbeat/heartbeat_ingest.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/instance_codec.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/telemetry/event_emitter.hpp"
#include "internal/util/errors.hpp"
#include "supervisor/v1.hpp"

namespace supervisor::service {

using namespace supervisor::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view instance_id, Fn&& fn) {
  supervisor::observability::SpanScope span(route);
  if (!instance_id.empty()) {
    span.SetAttribute("instance.id", instance_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      supervisor::observability::Metrics::Instance().RecordRequest(route, true);
      supervisor::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return;
    } else {
      auto result = fn();
      supervisor::observability::Metrics::Instance().RecordRequest(route, true);
      supervisor::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SUPERVISOR_LOG_ERROR("RPC failed", {supervisor::observability::StringField("route", route), supervisor::observability::StringField("error", ex.what()),
                                        supervisor::observability::StringField("instance_id", instance_id)});
    supervisor::observability::Metrics::Instance().RecordRequest(route, false);
    supervisor::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateInstanceResponse RegistryService::CreateInstance(const CreateInstanceRequest& req) {
  return ObserveRpc("RegistryService.CreateInstance", "", [&] {
    const auto created = ctx_.registry->CreateInstance(req.task_id(), req.task_list_id(), req.pid(), req.hostname());

    CreateInstanceResponse resp;
    resp.set_instance_id(created.instance_id);
    resp.set_execution_id(created.execution_id);
    return resp;
  });
}

void RegistryService::AttachProcess(const AttachProcessRequest& req) {
  ObserveRpc("RegistryService.AttachProcess", req.instance_id(), [&] { ctx_.registry->AttachProcess(req.instance_id(), req.pid(), req.hostname()); });
}

MarkTerminalResponse RegistryService::MarkTerminal(const MarkTerminalRequest& req) {
  return ObserveRpc("RegistryService.MarkTerminal", req.instance_id(), [&] {
    const auto transition = ctx_.registry->MarkTerminal(req.instance_id(), req.status(), req.reason());

    MarkTerminalResponse resp;
    resp.set_applied(transition.applied);
    *resp.mutable_instance() = supervisor::registry::ToProto(transition.instance);
    return resp;
  });
}

HeartbeatResponse RegistryService::Heartbeat(const HeartbeatRequest& req) {
  return ObserveRpc("RegistryService.Heartbeat", req.instance_id(), [&] { return ctx_.heartbeat->Heartbeat(req); });
}

} // namespace supervisor::service
