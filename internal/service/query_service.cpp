#include "query_service.hpp"

#include <chrono>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/query/reconciled_state_query.hpp"
#include "internal/stream/fanout.hpp"
#include "supervisor/v1.hpp"

namespace supervisor::service {

using namespace supervisor::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view key, std::string_view value, Fn&& fn) {
  supervisor::observability::SpanScope span(route);
  if (!value.empty()) {
    span.SetAttribute(key, value);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    supervisor::observability::Metrics::Instance().RecordRequest(route, true);
    supervisor::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SUPERVISOR_LOG_ERROR("RPC failed", {supervisor::observability::StringField("route", route), supervisor::observability::StringField("error", ex.what()),
                                        supervisor::observability::StringField(key, value)});
    supervisor::observability::Metrics::Instance().RecordRequest(route, false);
    supervisor::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

QueryService::QueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

supervisor::core::v1::EffectiveStatus QueryService::EffectiveStatus(const EffectiveStatusRequest& req) {
  return ObserveRpc("QueryService.EffectiveStatus", "instance_id", req.instance_id(), [&] { return ctx_.query->GetEffectiveStatus(req.instance_id()); });
}

ListInstancesResponse QueryService::ListInstances(const ListInstancesRequest& req) {
  return ObserveRpc("QueryService.ListInstances", "task_id", req.task_id(), [&] { return ctx_.query->ListInstances(req); });
}

Execution QueryService::GetExecution(const GetExecutionRequest& req) {
  return ObserveRpc("QueryService.GetExecution", "instance_id", req.instance_id(), [&] { return ctx_.query->GetExecution(req.instance_id()); });
}

GetTranscriptResponse QueryService::GetTranscript(const GetTranscriptRequest& req) {
  return ObserveRpc("QueryService.GetTranscript", "execution_id", req.execution_id(), [&] {
    const auto max_entries = req.max_entries() == 0 ? std::optional<uint64_t>{} : std::make_optional<uint64_t>(req.max_entries());
    return ctx_.query->GetTranscript(req.execution_id(), req.from_sequence(), max_entries);
  });
}

ListToolUsesResponse QueryService::ListToolUses(const ListToolUsesRequest& req) {
  return ObserveRpc("QueryService.ListToolUses", "execution_id", req.execution_id(),
                    [&] { return ctx_.query->ListToolUses(req.execution_id(), req.errors_only()); });
}

AssertionSummary QueryService::GetAssertionSummary(const GetAssertionSummaryRequest& req) {
  return ObserveRpc("QueryService.GetAssertionSummary", "execution_id", req.execution_id(),
                    [&] { return ctx_.query->GetAssertionSummary(req.execution_id()); });
}

std::shared_ptr<supervisor::stream::Subscription> QueryService::Subscribe(const SubscribeRequest& req) {
  return ObserveRpc("QueryService.Subscribe", "execution_id", req.execution_id(), [&] {
    const auto from = req.has_from_sequence() ? std::make_optional<uint64_t>(req.from_sequence()) : std::optional<uint64_t>{};
    return ctx_.fanout->Subscribe(req.execution_id(), from);
  });
}

void QueryService::Unsubscribe(const std::shared_ptr<supervisor::stream::Subscription>& subscription) {
  ctx_.fanout->Unsubscribe(subscription);
}

} // namespace supervisor::service
