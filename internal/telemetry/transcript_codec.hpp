#pragma once

#include <optional>
#include <string>

#include "internal/db/model/assertion_result_record.hpp"
#include "internal/db/model/tool_use_record.hpp"
#include "internal/db/model/transcript_entry_record.hpp"
#include "supervisor/core/v1/transcript.pb.h"

namespace google::protobuf {
class Struct;
}

namespace supervisor::telemetry {

std::string                 PayloadToJson(const google::protobuf::Struct& payload);
google::protobuf::Struct    PayloadFromJson(const std::string& json);

supervisor::core::v1::TranscriptEntry ToProto(const supervisor::db::model::TranscriptEntryRecord& record);
supervisor::core::v1::ToolUse         ToProto(const supervisor::db::model::ToolUseRecord& record);
supervisor::core::v1::AssertionResult ToProto(const supervisor::db::model::AssertionResultRecord& record);

// Projections derived from an entry payload. Throw util::InvalidArgument
// when a required key is missing or malformed.
supervisor::db::model::ToolUseRecord         ToolUseFromPayload(const supervisor::db::model::TranscriptEntryRecord& entry,
                                                                const google::protobuf::Struct& payload);
supervisor::db::model::AssertionResultRecord AssertionFromPayload(const supervisor::db::model::TranscriptEntryRecord& entry,
                                                                  const google::protobuf::Struct& payload);

// "pass" | "fail" | "skip" | "warn"
std::optional<supervisor::core::v1::AssertionOutcome> ParseAssertionOutcome(const std::string& text);

} // namespace supervisor::telemetry
