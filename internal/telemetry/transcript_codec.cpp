#include "transcript_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <limits>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace supervisor::telemetry {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const Value* Field(const Struct& payload, const std::string& key) {
  const auto it = payload.fields().find(key);
  return it == payload.fields().end() ? nullptr : &it->second;
}

std::string StringOr(const Struct& payload, const std::string& key, const std::string& fallback = {}) {
  const auto* value = Field(payload, key);
  if (!value || value->kind_case() == Value::kNullValue) {
    return fallback;
  }
  if (value->kind_case() != Value::kStringValue) {
    throw supervisor::util::InvalidArgument("payload." + key + " must be a string");
  }
  return value->string_value();
}

bool BoolOr(const Struct& payload, const std::string& key, bool fallback) {
  const auto* value = Field(payload, key);
  if (!value || value->kind_case() == Value::kNullValue) {
    return fallback;
  }
  if (value->kind_case() != Value::kBoolValue) {
    throw supervisor::util::InvalidArgument("payload." + key + " must be a boolean");
  }
  return value->bool_value();
}

uint64_t UnsignedOr(const Struct& payload, const std::string& key, uint64_t fallback) {
  const auto* value = Field(payload, key);
  if (!value || value->kind_case() == Value::kNullValue) {
    return fallback;
  }
  if (value->kind_case() != Value::kNumberValue || value->number_value() < 0 || !std::isfinite(value->number_value())) {
    throw supervisor::util::InvalidArgument("payload." + key + " must be a non-negative number");
  }
  return static_cast<uint64_t>(std::llround(value->number_value()));
}

} // namespace

std::string PayloadToJson(const Struct& payload) {
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(payload, &json).ok()) {
    throw supervisor::util::InvalidArgument("payload is not representable as JSON");
  }
  return json.empty() ? "{}" : json;
}

Struct PayloadFromJson(const std::string& json) {
  Struct payload;
  if (json.empty()) {
    return payload;
  }
  if (!google::protobuf::util::JsonStringToMessage(json, &payload).ok()) {
    throw std::runtime_error("stored transcript payload is not a JSON object");
  }
  return payload;
}

supervisor::core::v1::TranscriptEntry ToProto(const supervisor::db::model::TranscriptEntryRecord& record) {
  supervisor::core::v1::TranscriptEntry entry;
  entry.set_entry_id(record.entry_id);
  entry.set_execution_id(record.execution_id);
  entry.set_instance_id(record.instance_id);
  entry.set_task_id(record.task_id);
  entry.set_sequence(record.sequence);
  entry.set_entry_type(record.entry_type);
  entry.set_category(record.category);
  entry.set_summary(record.summary);
  *entry.mutable_payload()      = PayloadFromJson(record.payload_json);
  *entry.mutable_committed_at() = supervisor::util::MillisToProto(record.committed_at_ms);
  return entry;
}

supervisor::core::v1::ToolUse ToProto(const supervisor::db::model::ToolUseRecord& record) {
  supervisor::core::v1::ToolUse tool_use;
  tool_use.set_entry_id(record.entry_id);
  tool_use.set_execution_id(record.execution_id);
  tool_use.set_sequence(record.sequence);
  tool_use.set_tool(record.tool);
  tool_use.set_input_summary(record.input_summary);
  tool_use.set_is_error(record.is_error);
  tool_use.set_is_blocked(record.is_blocked);
  tool_use.set_duration_ms(record.duration_ms);
  tool_use.set_error_message(record.error_message);
  return tool_use;
}

supervisor::core::v1::AssertionResult ToProto(const supervisor::db::model::AssertionResultRecord& record) {
  supervisor::core::v1::AssertionResult result;
  result.set_entry_id(record.entry_id);
  result.set_execution_id(record.execution_id);
  result.set_sequence(record.sequence);
  result.set_assertion_id(record.assertion_id);
  result.set_category(record.category);
  result.set_result(record.result);
  result.set_message(record.message);
  result.set_chain_id(record.chain_id);
  result.set_chain_position(record.chain_position);
  return result;
}

std::optional<supervisor::core::v1::AssertionOutcome> ParseAssertionOutcome(const std::string& text) {
  if (text == "pass") return supervisor::core::v1::ASSERTION_OUTCOME_PASS;
  if (text == "fail") return supervisor::core::v1::ASSERTION_OUTCOME_FAIL;
  if (text == "skip") return supervisor::core::v1::ASSERTION_OUTCOME_SKIP;
  if (text == "warn") return supervisor::core::v1::ASSERTION_OUTCOME_WARN;
  return std::nullopt;
}

supervisor::db::model::ToolUseRecord ToolUseFromPayload(const supervisor::db::model::TranscriptEntryRecord& entry, const Struct& payload) {
  supervisor::db::model::ToolUseRecord record;
  record.entry_id     = entry.entry_id;
  record.execution_id = entry.execution_id;
  record.sequence     = entry.sequence;

  record.tool = StringOr(payload, "tool");
  if (record.tool.empty()) {
    throw supervisor::util::InvalidArgument("tool_use entry requires payload.tool");
  }
  record.input_summary = StringOr(payload, "input_summary");
  record.is_error      = BoolOr(payload, "is_error", false);
  record.is_blocked    = BoolOr(payload, "is_blocked", false);
  record.duration_ms   = UnsignedOr(payload, "duration_ms", 0);
  record.error_message = StringOr(payload, "error_message");
  return record;
}

supervisor::db::model::AssertionResultRecord AssertionFromPayload(const supervisor::db::model::TranscriptEntryRecord& entry,
                                                                  const Struct& payload) {
  supervisor::db::model::AssertionResultRecord record;
  record.entry_id     = entry.entry_id;
  record.execution_id = entry.execution_id;
  record.sequence     = entry.sequence;
  record.category     = entry.category;

  const auto outcome_text = StringOr(payload, "result");
  const auto outcome      = ParseAssertionOutcome(outcome_text);
  if (!outcome.has_value()) {
    throw supervisor::util::InvalidArgument("assertion entry requires payload.result of pass, fail, skip or warn; got '" + outcome_text + "'");
  }
  record.result       = *outcome;
  record.assertion_id = StringOr(payload, "assertion_id");
  record.message      = StringOr(payload, "message");

  record.chain_id = StringOr(payload, "chain_id");
  const auto position = UnsignedOr(payload, "chain_position", 0);
  if (record.chain_id.empty() && position != 0) {
    throw supervisor::util::InvalidArgument("assertion entry has payload.chain_position without payload.chain_id");
  }
  if (position > std::numeric_limits<uint32_t>::max()) {
    throw supervisor::util::InvalidArgument("assertion entry payload.chain_position is out of range");
  }
  record.chain_position = static_cast<uint32_t>(position);
  return record;
}

} // namespace supervisor::telemetry
