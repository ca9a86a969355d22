#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace supervisor::db::memory {

namespace {

bool Matches(const model::InstanceRecord& r, const InstanceFilter& filter) {
  if (!filter.task_id.empty() && r.task_id != filter.task_id) return false;
  if (!filter.task_list_id.empty() && r.task_list_id != filter.task_list_id) return false;
  if (!filter.statuses.empty() && std::find(filter.statuses.begin(), filter.statuses.end(), r.status) == filter.statuses.end()) {
    return false;
  }
  if (filter.heartbeat_before_ms.has_value() && r.last_heartbeat_at_ms >= *filter.heartbeat_before_ms) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result MemoryRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.instances.contains(r.instance_id)) return Result::Err(ErrorCode::AlreadyExists, "instance " + r.instance_id);
  s.instances[r.instance_id] = r;
  TX(t).OnRollback([&s, id = r.instance_id] { s.instances.erase(id); });
  return Result::Ok();
}

std::optional<model::InstanceRecord> MemoryRepository::GetInstance(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.instances.find(id);
  if (it == s.instances.end()) return std::nullopt;
  return it->second;
}

std::vector<model::InstanceRecord> MemoryRepository::ListInstances(Transaction& t, const InstanceFilter& filter) {
  const auto&                        s = TX(t).View();
  std::vector<model::InstanceRecord> out;
  for (const auto& [_, record] : s.instances) {
    if (Matches(record, filter)) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.started_at_ms, a.instance_id) < std::tie(b.started_at_ms, b.instance_id);
  });
  return out;
}

Result MemoryRepository::UpdateInstance(Transaction& t, model::InstanceRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.instances.find(r.instance_id);
  if (it == s.instances.end()) return Result::Err(ErrorCode::NotFound, "instance " + r.instance_id);
  if (it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "instance " + r.instance_id + " version moved");
  }

  TX(t).OnRollback([&s, previous = it->second] { s.instances[previous.instance_id] = previous; });
  r.version  = expected_version + 1;
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result MemoryRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.executions.contains(r.execution_id)) return Result::Err(ErrorCode::AlreadyExists, "execution " + r.execution_id);
  if (s.execution_by_instance.contains(r.instance_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "instance " + r.instance_id + " already owns an execution");
  }
  s.executions[r.execution_id]           = r;
  s.execution_by_instance[r.instance_id] = r.execution_id;
  TX(t).OnRollback([&s, r] {
    s.executions.erase(r.execution_id);
    s.execution_by_instance.erase(r.instance_id);
  });
  return Result::Ok();
}

std::optional<model::ExecutionRecord> MemoryRepository::GetExecution(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.executions.find(id);
  if (it == s.executions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ExecutionRecord> MemoryRepository::GetExecutionByInstance(Transaction& t, const std::string& instance_id) {
  const auto& s  = TX(t).View();
  auto        it = s.execution_by_instance.find(instance_id);
  if (it == s.execution_by_instance.end()) return std::nullopt;
  return GetExecution(t, it->second);
}

Result MemoryRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.executions.find(r.execution_id);
  if (it == s.executions.end()) return Result::Err(ErrorCode::NotFound, "execution " + r.execution_id);
  TX(t).OnRollback([&s, previous = it->second] { s.executions[previous.execution_id] = previous; });
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Transcript
// ------------------------------------------------------------------

Result MemoryRepository::AppendTranscriptEntry(Transaction& t, model::TranscriptEntryRecord& entry) {
  auto& s = TX(t).Mutable();
  if (!s.executions.contains(entry.execution_id)) {
    return Result::Err(ErrorCode::NotFound, "execution " + entry.execution_id);
  }

  auto& entries  = s.transcript[entry.execution_id];
  entry.sequence = entries.empty() ? 1 : entries.rbegin()->first + 1;
  entries.emplace(entry.sequence, entry);
  TX(t).OnRollback([&s, execution_id = entry.execution_id, sequence = entry.sequence] { s.transcript[execution_id].erase(sequence); });
  return Result::Ok();
}

std::vector<model::TranscriptEntryRecord> MemoryRepository::ReadTranscript(Transaction& t, const std::string& execution_id, uint64_t from_sequence,
                                                                           std::optional<uint64_t> max_entries) {
  std::vector<model::TranscriptEntryRecord> out;
  const auto&                               s  = TX(t).View();
  const auto                                it = s.transcript.find(execution_id);
  if (it == s.transcript.end()) {
    return out;
  }

  for (auto e = it->second.lower_bound(from_sequence); e != it->second.end(); ++e) {
    if (max_entries.has_value() && out.size() >= *max_entries) {
      break;
    }
    out.push_back(e->second);
  }
  return out;
}

uint64_t MemoryRepository::GetMaxSequence(Transaction& t, const std::string& execution_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.transcript.find(execution_id);
  if (it == s.transcript.end() || it->second.empty()) {
    return 0;
  }
  return it->second.rbegin()->first;
}

// ------------------------------------------------------------------
// Projections
// ------------------------------------------------------------------

Result MemoryRepository::InsertToolUse(Transaction& t, const model::ToolUseRecord& r) {
  auto& s = TX(t).Mutable();
  s.tool_uses[r.execution_id].push_back(r);
  TX(t).OnRollback([&s, execution_id = r.execution_id] { s.tool_uses[execution_id].pop_back(); });
  return Result::Ok();
}

std::vector<model::ToolUseRecord> MemoryRepository::ListToolUses(Transaction& t, const std::string& execution_id, bool errors_only) {
  std::vector<model::ToolUseRecord> out;
  const auto&                       s  = TX(t).View();
  const auto                        it = s.tool_uses.find(execution_id);
  if (it == s.tool_uses.end()) {
    return out;
  }
  for (const auto& r : it->second) {
    if (errors_only && !r.is_error) continue;
    out.push_back(r);
  }
  return out;
}

Result MemoryRepository::InsertAssertionResult(Transaction& t, const model::AssertionResultRecord& r) {
  auto& s = TX(t).Mutable();
  s.assertions[r.execution_id].push_back(r);
  TX(t).OnRollback([&s, execution_id = r.execution_id] { s.assertions[execution_id].pop_back(); });
  return Result::Ok();
}

std::vector<model::AssertionResultRecord> MemoryRepository::ListAssertionResults(Transaction& t, const std::string& execution_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.assertions.find(execution_id);
  if (it == s.assertions.end()) {
    return {};
  }
  return it->second;
}

} // namespace supervisor::db::memory
