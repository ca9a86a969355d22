#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/config/supervisor_options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "supervisor/services/v1/supervisor_query_service.pb.h"

namespace supervisor::query {

/*
  Read path for every consumer.

  Status is never served from a cached column: staleness is derived at
  read time from the stored status and the heartbeat recency.
*/
class ReconciledStateQuery {
 public:
  ReconciledStateQuery(std::shared_ptr<supervisor::db::Repository> repository, std::shared_ptr<supervisor::util::Clock> clock,
                       supervisor::config::LivenessOptions options);

  // Never throws for an unknown instance; found=false instead.
  supervisor::core::v1::EffectiveStatus GetEffectiveStatus(const std::string& instance_id);

  supervisor::services::v1::ListInstancesResponse ListInstances(const supervisor::services::v1::ListInstancesRequest& req);

  supervisor::core::v1::Execution GetExecution(const std::string& instance_id);

  supervisor::services::v1::GetTranscriptResponse GetTranscript(const std::string& execution_id, uint64_t from_sequence,
                                                                std::optional<uint64_t> max_entries);

  supervisor::services::v1::ListToolUsesResponse ListToolUses(const std::string& execution_id, bool errors_only);

  supervisor::core::v1::AssertionSummary GetAssertionSummary(const std::string& execution_id);

 private:
  supervisor::core::v1::EffectiveStatus Reconcile(const supervisor::db::model::InstanceRecord& record, const std::string& execution_id,
                                                  uint64_t now_ms) const;

  void RequireExecution(supervisor::db::Transaction& tx, const std::string& execution_id, const std::string& op);

  std::shared_ptr<supervisor::db::Repository> repository_;
  std::shared_ptr<supervisor::util::Clock>    clock_;
  supervisor::config::LivenessOptions         options_;
};

} // namespace supervisor::query
