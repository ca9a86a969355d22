#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace supervisor::db {

// Translates a failed repository Result into the util exception taxonomy.
void ThrowIfDbError(const Result& result, const std::string& context);

bool IsTransient(ErrorCode code);

} // namespace supervisor::db
