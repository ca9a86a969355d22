#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace supervisor::db::sql {

// Records the highest applied step; created on first use by every backend.
inline constexpr const char* kSchemaVersionTable = "CREATE TABLE IF NOT EXISTS schema_version (version BIGINT PRIMARY KEY);";

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  // 0 on a fresh store.
  virtual int64_t AppliedVersion() = 0;

  // Runs one step and records its version in the same transaction.
  virtual void ApplyStep(int64_t version, const std::string& sql) = 0;
};

/*
  Step i of ordered_sql (1-based) is schema version i. Steps at or below
  the recorded version are skipped, so a restart applies only what is new.

  Throws std::runtime_error when the store was migrated by a newer build.
  Returns the number of steps applied.
*/
std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace supervisor::db::sql
