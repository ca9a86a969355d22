#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace supervisor::db::sql {

std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  const auto known   = static_cast<int64_t>(ordered_sql.size());
  const auto applied = executor.AppliedVersion();
  if (applied > known) {
    throw std::runtime_error("store schema version " + std::to_string(applied) + " is newer than this build (" + std::to_string(known) + ")");
  }

  for (auto version = applied + 1; version <= known; ++version) {
    executor.ApplyStep(version, ordered_sql[static_cast<std::size_t>(version - 1)]);
  }

  const auto ran = static_cast<std::size_t>(known - applied);
  if (ran > 0) {
    SUPERVISOR_LOG_INFO("Schema migrated", {supervisor::observability::IntField("from", applied), supervisor::observability::IntField("to", known)});
  }
  return ran;
}

} // namespace supervisor::db::sql
