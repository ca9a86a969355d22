#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace supervisor::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Lock waits are bounded by busy_timeout_ms; a statement that still
  cannot get the lock surfaces as util::StoreUnavailable.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, uint64_t busy_timeout_ms = 5000, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // pragmas, migrations and transaction control
  void Exec(const std::string& sql);

  int64_t AppliedVersion() override;
  void    ApplyStep(int64_t version, const std::string& sql) override;

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(uint64_t busy_timeout_ms, bool wal_mode);

  // One connection is shared; a transaction owns it while open.
  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Throws StoreUnavailable for busy/locked/io codes, runtime_error otherwise.
  [[noreturn]] static void Throw(sqlite3* db, int rc, const std::string& what);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace supervisor::db::sqlite
