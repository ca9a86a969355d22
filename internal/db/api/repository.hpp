#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/assertion_result_record.hpp"
#include "internal/db/model/execution_record.hpp"
#include "internal/db/model/instance_record.hpp"
#include "internal/db/model/tool_use_record.hpp"
#include "internal/db/model/transcript_entry_record.hpp"

namespace supervisor::db {

/*
  Instance selection used by listing and by the reaper scan.
  Empty fields match everything.
*/
struct InstanceFilter {
  std::string task_id;
  std::string task_list_id;

  std::vector<supervisor::core::v1::InstanceStatus> statuses;

  // last_heartbeat_at_ms strictly below this value
  std::optional<uint64_t> heartbeat_before_ms;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateInstance is a compare-and-swap on version
  - Transcript sequences are assigned here, per execution, inside the
    caller's transaction

  The DB is the source of truth for:
    instance status and heartbeat recency
    executions
    transcript entries and their projections

  Reads that fail for backend reasons throw util::StoreUnavailable
  (busy, locked, unreachable) or std::runtime_error.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Instances
  // ---------------------------------------------------------------------

  virtual Result InsertInstance(Transaction&, const model::InstanceRecord&) = 0;

  virtual std::optional<model::InstanceRecord> GetInstance(Transaction&, const std::string& instance_id) = 0;

  // Ordered by (started_at_ms, instance_id).
  virtual std::vector<model::InstanceRecord> ListInstances(Transaction&, const InstanceFilter& filter) = 0;

  // Writes record only if the stored version equals expected_version, then
  // bumps record.version. Conflict when the row moved on, NotFound when absent.
  virtual Result UpdateInstance(Transaction&, model::InstanceRecord& record, uint64_t expected_version) = 0;

  // ---------------------------------------------------------------------
  // Executions
  // ---------------------------------------------------------------------

  virtual Result InsertExecution(Transaction&, const model::ExecutionRecord&) = 0;

  virtual std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string& execution_id) = 0;

  virtual std::optional<model::ExecutionRecord> GetExecutionByInstance(Transaction&, const std::string& instance_id) = 0;

  virtual Result UpdateExecution(Transaction&, const model::ExecutionRecord&) = 0;

  // ---------------------------------------------------------------------
  // Transcript
  // ---------------------------------------------------------------------

  // Assigns entry.sequence = 1 + max sequence of the execution.
  virtual Result AppendTranscriptEntry(Transaction&, model::TranscriptEntryRecord& entry) = 0;

  virtual std::vector<model::TranscriptEntryRecord> ReadTranscript(Transaction&, const std::string& execution_id, uint64_t from_sequence,
                                                                   std::optional<uint64_t> max_entries) = 0;

  // 0 when the execution has no entries.
  virtual uint64_t GetMaxSequence(Transaction&, const std::string& execution_id) = 0;

  // ---------------------------------------------------------------------
  // Projections
  // ---------------------------------------------------------------------

  virtual Result InsertToolUse(Transaction&, const model::ToolUseRecord&) = 0;

  virtual std::vector<model::ToolUseRecord> ListToolUses(Transaction&, const std::string& execution_id, bool errors_only) = 0;

  virtual Result InsertAssertionResult(Transaction&, const model::AssertionResultRecord&) = 0;

  virtual std::vector<model::AssertionResultRecord> ListAssertionResults(Transaction&, const std::string& execution_id) = 0;
};

} // namespace supervisor::db
