#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace supervisor::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertInstance(Transaction&, const model::InstanceRecord&) override;
  std::optional<model::InstanceRecord> GetInstance(Transaction&, const std::string&) override;
  std::vector<model::InstanceRecord> ListInstances(Transaction&, const InstanceFilter&) override;
  Result UpdateInstance(Transaction&, model::InstanceRecord&, uint64_t expected_version) override;

  Result InsertExecution(Transaction&, const model::ExecutionRecord&) override;
  std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string&) override;
  std::optional<model::ExecutionRecord> GetExecutionByInstance(Transaction&, const std::string&) override;
  Result UpdateExecution(Transaction&, const model::ExecutionRecord&) override;

  Result AppendTranscriptEntry(Transaction&, model::TranscriptEntryRecord&) override;
  std::vector<model::TranscriptEntryRecord> ReadTranscript(
      Transaction&, const std::string& execution_id, uint64_t from_sequence,
      std::optional<uint64_t> max_entries) override;
  uint64_t GetMaxSequence(Transaction&, const std::string& execution_id) override;

  Result InsertToolUse(Transaction&, const model::ToolUseRecord&) override;
  std::vector<model::ToolUseRecord> ListToolUses(Transaction&, const std::string& execution_id,
                                                 bool errors_only) override;
  Result InsertAssertionResult(Transaction&, const model::AssertionResultRecord&) override;
  std::vector<model::AssertionResultRecord> ListAssertionResults(
      Transaction&, const std::string& execution_id) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
