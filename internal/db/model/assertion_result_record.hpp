#pragma once

#include <cstdint>
#include <string>

#include "supervisor/core/v1/types.pb.h"

namespace supervisor::db::model {

// Projection of an assertion transcript entry.
struct AssertionResultRecord {
  std::string entry_id;
  std::string execution_id;
  uint64_t    sequence = 0;

  std::string assertion_id;
  std::string category;

  supervisor::core::v1::AssertionOutcome result = supervisor::core::v1::ASSERTION_OUTCOME_UNSPECIFIED;

  std::string message;

  std::string chain_id;
  uint32_t    chain_position = 0;
};

} // namespace supervisor::db::model
