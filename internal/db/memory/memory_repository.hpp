#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace supervisor::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::InstanceRecord> instances;

    std::unordered_map<std::string, model::ExecutionRecord> executions;
    std::unordered_map<std::string, std::string> execution_by_instance;

    // per execution, keyed by sequence
    std::unordered_map<std::string, std::map<uint64_t, model::TranscriptEntryRecord>> transcript;
    std::unordered_map<std::string, std::vector<model::ToolUseRecord>> tool_uses;
    std::unordered_map<std::string, std::vector<model::AssertionResultRecord>> assertions;
  };

  std::mutex mutex_;
  State state_;
};

}
