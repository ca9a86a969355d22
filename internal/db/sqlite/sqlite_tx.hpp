#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace supervisor::db::sqlite {

/*
  BEGIN IMMEDIATE on the shared connection.

  Taking the write lock up front means a compare-and-swap never upgrades
  from a read lock mid-transaction, so a busy database shows up at Begin
  as StoreUnavailable instead of as a half-applied write. The writer
  mutex is held until the transaction finishes.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  void Finish();

  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool open_ = false;
};

}
