#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace supervisor::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
  open_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    SUPERVISOR_LOG_WARN("sqlite rollback failed", {supervisor::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (!open_) {
    throw std::logic_error("sqlite transaction already finished");
  }
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception&) {
    // a failed COMMIT leaves the transaction open; undo it before releasing the writer
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      SUPERVISOR_LOG_WARN("sqlite rollback after failed commit failed", {supervisor::observability::StringField("error", e.what())});
    }
    Finish();
    throw;
  }
  Finish();
}

void SqliteTransaction::Rollback() {
  if (!open_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (...) {
    Finish();
    throw;
  }
  Finish();
}

void SqliteTransaction::Finish() {
  open_ = false;
  lock_.unlock();
}

} // namespace supervisor::db::sqlite
