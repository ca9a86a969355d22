#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace supervisor::testing {

using supervisor::db::model::AssertionResultRecord;
using supervisor::db::model::ExecutionRecord;
using supervisor::db::model::InstanceRecord;
using supervisor::db::model::ToolUseRecord;
using supervisor::db::model::TranscriptEntryRecord;

// Forwards to a memory store; scans and execution lookups fail on demand,
// and on_read_transcript runs inside every transcript read.
class FlakyRepository final : public supervisor::db::Repository {
 public:
  std::unique_ptr<supervisor::db::Transaction> Begin() override {
    return inner.Begin();
  }

  supervisor::db::Result InsertInstance(supervisor::db::Transaction& tx, const InstanceRecord& r) override {
    return inner.InsertInstance(tx, r);
  }
  std::optional<InstanceRecord> GetInstance(supervisor::db::Transaction& tx, const std::string& id) override {
    return inner.GetInstance(tx, id);
  }
  std::vector<InstanceRecord> ListInstances(supervisor::db::Transaction& tx, const supervisor::db::InstanceFilter& filter) override {
    if (fail_scans) {
      throw supervisor::util::StoreUnavailable("database is locked");
    }
    return inner.ListInstances(tx, filter);
  }
  supervisor::db::Result UpdateInstance(supervisor::db::Transaction& tx, InstanceRecord& r, uint64_t expected_version) override {
    return inner.UpdateInstance(tx, r, expected_version);
  }

  supervisor::db::Result InsertExecution(supervisor::db::Transaction& tx, const ExecutionRecord& r) override {
    return inner.InsertExecution(tx, r);
  }
  std::optional<ExecutionRecord> GetExecution(supervisor::db::Transaction& tx, const std::string& id) override {
    return inner.GetExecution(tx, id);
  }
  std::optional<ExecutionRecord> GetExecutionByInstance(supervisor::db::Transaction& tx, const std::string& id) override {
    if (fail_execution_reads) {
      throw supervisor::util::StoreUnavailable("database is locked");
    }
    return inner.GetExecutionByInstance(tx, id);
  }
  supervisor::db::Result UpdateExecution(supervisor::db::Transaction& tx, const ExecutionRecord& r) override {
    return inner.UpdateExecution(tx, r);
  }

  supervisor::db::Result AppendTranscriptEntry(supervisor::db::Transaction& tx, TranscriptEntryRecord& e) override {
    return inner.AppendTranscriptEntry(tx, e);
  }
  std::vector<TranscriptEntryRecord> ReadTranscript(supervisor::db::Transaction& tx, const std::string& id, uint64_t from,
                                                    std::optional<uint64_t> max) override {
    if (on_read_transcript) {
      // invoke a copy: the hook may reset on_read_transcript while running
      auto hook = on_read_transcript;
      hook();
    }
    return inner.ReadTranscript(tx, id, from, max);
  }
  uint64_t GetMaxSequence(supervisor::db::Transaction& tx, const std::string& id) override {
    return inner.GetMaxSequence(tx, id);
  }

  supervisor::db::Result InsertToolUse(supervisor::db::Transaction& tx, const ToolUseRecord& r) override {
    return inner.InsertToolUse(tx, r);
  }
  std::vector<ToolUseRecord> ListToolUses(supervisor::db::Transaction& tx, const std::string& id, bool errors_only) override {
    return inner.ListToolUses(tx, id, errors_only);
  }
  supervisor::db::Result InsertAssertionResult(supervisor::db::Transaction& tx, const AssertionResultRecord& r) override {
    return inner.InsertAssertionResult(tx, r);
  }
  std::vector<AssertionResultRecord> ListAssertionResults(supervisor::db::Transaction& tx, const std::string& id) override {
    return inner.ListAssertionResults(tx, id);
  }

  supervisor::db::memory::MemoryRepository inner;
  bool                                     fail_scans           = false;
  bool                                     fail_execution_reads = false;
  std::function<void()>                    on_read_transcript;
};

} // namespace supervisor::testing
