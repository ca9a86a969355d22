#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace supervisor::db::postgres {

/*
  Bounded pool of libpqxx connections, which are not thread-safe and are
  therefore handed to exactly one transaction at a time.

  Every connection is opened with statement and lock timeouts equal to the
  store operation timeout. Acquire() waits that long for a free slot and
  then throws util::StoreUnavailable. Connections the server dropped are
  discarded on the way out of the idle list.

  The handle returned by Acquire() puts the connection back when the last
  reference goes away, or closes it if the pool is already gone.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections = 16, uint64_t operation_timeout_ms = 5000);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::unique_ptr<pqxx::connection> Connect();
  std::unique_ptr<pqxx::connection> TakeIdle(std::unique_lock<std::mutex>& lock);
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              Return(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;
  uint64_t    operation_timeout_ms_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

// Holds one pooled connection for the whole migration run.
class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()) {
  }

  int64_t AppliedVersion() override;
  void    ApplyStep(int64_t version, const std::string& sql) override;

 private:
  std::shared_ptr<pqxx::connection> conn_;
};

} // namespace supervisor::db::postgres
