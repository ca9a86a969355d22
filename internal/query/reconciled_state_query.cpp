#include "reconciled_state_query.hpp"

#include <map>

#include "internal/heartbeat/liveness.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/registry/instance_codec.hpp"
#include "internal/telemetry/transcript_codec.hpp"
#include "internal/util/errors.hpp"
#include "supervisor/v1.hpp"

namespace supervisor::query {

using namespace supervisor::v1;

ReconciledStateQuery::ReconciledStateQuery(std::shared_ptr<supervisor::db::Repository> repository,
                                           std::shared_ptr<supervisor::util::Clock> clock, supervisor::config::LivenessOptions options)
    : repository_(std::move(repository)), clock_(std::move(clock)), options_(options) {
  if (!clock_) {
    clock_ = std::make_shared<supervisor::util::WallClock>();
  }
}

EffectiveStatus ReconciledStateQuery::Reconcile(const supervisor::db::model::InstanceRecord& record, const std::string& execution_id,
                                                uint64_t now_ms) const {
  EffectiveStatus out;
  out.set_instance_id(record.instance_id);
  out.set_found(true);
  out.set_status(record.status);
  out.set_is_stale(supervisor::heartbeat::IsStale(record, now_ms, options_.StaleTimeoutMs()));
  if (record.last_heartbeat_at_ms > 0) {
    out.set_last_seen_ago_ms(now_ms > record.last_heartbeat_at_ms ? now_ms - record.last_heartbeat_at_ms : 0);
  }
  out.set_termination_reason(record.termination_reason);
  out.set_task_id(record.task_id);
  out.set_task_list_id(record.task_list_id);
  out.set_execution_id(execution_id);
  return out;
}

void ReconciledStateQuery::RequireExecution(supervisor::db::Transaction& tx, const std::string& execution_id, const std::string& op) {
  if (execution_id.empty()) {
    throw supervisor::util::InvalidArgument(op + ": execution_id is required");
  }
  if (!repository_->GetExecution(tx, execution_id).has_value()) {
    throw supervisor::util::NotFound(op + ": execution " + execution_id + " not found");
  }
}

EffectiveStatus ReconciledStateQuery::GetEffectiveStatus(const std::string& instance_id) {
  const auto now_ms = clock_->NowMs();

  auto tx     = repository_->Begin();
  auto record = repository_->GetInstance(*tx, instance_id);
  if (!record.has_value()) {
    tx->Commit();
    supervisor::core::v1::EffectiveStatus missing;
    missing.set_instance_id(instance_id);
    missing.set_found(false);
    return missing;
  }
  const auto execution = repository_->GetExecutionByInstance(*tx, instance_id);
  tx->Commit();

  return Reconcile(*record, execution.has_value() ? execution->execution_id : std::string{}, now_ms);
}

ListInstancesResponse ReconciledStateQuery::ListInstances(const ListInstancesRequest& req) {
  supervisor::db::InstanceFilter filter;
  filter.task_id      = req.task_id();
  filter.task_list_id = req.task_list_id();
  for (const auto status : req.statuses()) {
    filter.statuses.push_back(static_cast<InstanceStatus>(status));
  }
  // An explicit status set wins; otherwise terminal rows are opt-in.
  if (filter.statuses.empty() && !req.include_terminal()) {
    filter.statuses = {INSTANCE_STATUS_PENDING, INSTANCE_STATUS_RUNNING};
  }
  if (req.stale_only()) {
    filter.statuses = {INSTANCE_STATUS_RUNNING};
  }

  const auto now_ms = clock_->NowMs();

  auto tx      = repository_->Begin();
  auto records = repository_->ListInstances(*tx, filter);

  ListInstancesResponse resp;
  uint32_t              skipped = 0;
  for (const auto& record : records) {
    if (req.stale_only() && !supervisor::heartbeat::IsStale(record, now_ms, options_.StaleTimeoutMs())) {
      continue;
    }
    if (skipped < req.offset()) {
      ++skipped;
      continue;
    }
    if (req.limit() > 0 && static_cast<uint32_t>(resp.instances_size()) >= req.limit()) {
      break;
    }
    const auto execution = repository_->GetExecutionByInstance(*tx, record.instance_id);
    *resp.add_instances() = Reconcile(record, execution.has_value() ? execution->execution_id : std::string{}, now_ms);
  }
  tx->Commit();
  return resp;
}

Execution ReconciledStateQuery::GetExecution(const std::string& instance_id) {
  if (instance_id.empty()) {
    throw supervisor::util::InvalidArgument("get execution: instance_id is required");
  }
  auto tx        = repository_->Begin();
  auto execution = repository_->GetExecutionByInstance(*tx, instance_id);
  tx->Commit();
  if (!execution.has_value()) {
    throw supervisor::util::NotFound("get execution: no execution for instance " + instance_id);
  }
  return supervisor::registry::ToProto(*execution);
}

GetTranscriptResponse ReconciledStateQuery::GetTranscript(const std::string& execution_id, uint64_t from_sequence,
                                                          std::optional<uint64_t> max_entries) {
  auto tx = repository_->Begin();
  RequireExecution(*tx, execution_id, "get transcript");
  const auto entries = repository_->ReadTranscript(*tx, execution_id, from_sequence, max_entries);
  tx->Commit();

  GetTranscriptResponse resp;
  for (const auto& entry : entries) {
    *resp.add_entries() = supervisor::telemetry::ToProto(entry);
  }
  return resp;
}

ListToolUsesResponse ReconciledStateQuery::ListToolUses(const std::string& execution_id, bool errors_only) {
  auto tx = repository_->Begin();
  RequireExecution(*tx, execution_id, "list tool uses");
  const auto tool_uses = repository_->ListToolUses(*tx, execution_id, errors_only);
  tx->Commit();

  ListToolUsesResponse resp;
  for (const auto& tool_use : tool_uses) {
    *resp.add_tool_uses() = supervisor::telemetry::ToProto(tool_use);
  }
  return resp;
}

AssertionSummary ReconciledStateQuery::GetAssertionSummary(const std::string& execution_id) {
  auto tx = repository_->Begin();
  RequireExecution(*tx, execution_id, "assertion summary");
  const auto results = repository_->ListAssertionResults(*tx, execution_id);
  tx->Commit();

  AssertionSummary summary;
  summary.set_execution_id(execution_id);
  summary.set_total(results.size());

  std::map<std::string, int> chain_index;
  std::map<std::string, uint32_t> first_failure_position;
  for (const auto& result : results) {
    if (!result.chain_id.empty()) {
      auto [it, inserted] = chain_index.emplace(result.chain_id, summary.chains_size());
      if (inserted) {
        summary.add_chains()->set_chain_id(result.chain_id);
      }
      auto* chain = summary.mutable_chains(it->second);
      chain->set_total(chain->total() + 1);
      if (result.result == ASSERTION_OUTCOME_PASS) {
        chain->set_passed(chain->passed() + 1);
      } else if (result.result == ASSERTION_OUTCOME_FAIL) {
        chain->set_failed(chain->failed() + 1);
        auto first = first_failure_position.find(result.chain_id);
        if (first == first_failure_position.end() || result.chain_position < first->second) {
          first_failure_position[result.chain_id] = result.chain_position;
          chain->set_first_failure_id(result.assertion_id);
        }
      }
    }

    switch (result.result) {
      case ASSERTION_OUTCOME_PASS:
        summary.set_passed(summary.passed() + 1);
        break;
      case ASSERTION_OUTCOME_FAIL:
        summary.set_failed(summary.failed() + 1);
        *summary.add_failures() = supervisor::telemetry::ToProto(result);
        break;
      case ASSERTION_OUTCOME_SKIP:
        summary.set_skipped(summary.skipped() + 1);
        break;
      case ASSERTION_OUTCOME_WARN:
        summary.set_warnings(summary.warnings() + 1);
        break;
      default:
        break;
    }
  }

  for (auto& chain : *summary.mutable_chains()) {
    chain.set_overall(chain.failed() > 0   ? ASSERTION_OUTCOME_FAIL
                      : chain.passed() > 0 ? ASSERTION_OUTCOME_PASS
                                           : ASSERTION_OUTCOME_SKIP);
  }
  summary.set_pass_rate(summary.total() == 0 ? 1.0 : static_cast<double>(summary.passed()) / static_cast<double>(summary.total()));
  return summary;
}

} // namespace supervisor::query
