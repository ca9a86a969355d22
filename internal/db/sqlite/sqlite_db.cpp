#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace supervisor::db::sqlite {

namespace {

bool IsTransient(int rc) {
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return true;
    default:
      return false;
  }
}

[[noreturn]] void ThrowCode(int rc, const std::string& msg) {
  if (IsTransient(rc)) {
    throw supervisor::util::StoreUnavailable(msg);
  }
  throw std::runtime_error(msg);
}

} // namespace

void SqliteDB::Throw(sqlite3* db, int rc, const std::string& what) {
  ThrowCode(rc, what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
}

SqliteDB::SqliteDB(std::string path, uint64_t busy_timeout_ms, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw supervisor::util::StoreUnavailable("sqlite open " + path_ + ": " + msg);
  }

  Configure(busy_timeout_ms, wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  const std::string detail = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  ThrowCode(rc, "sqlite exec: " + detail);
}

int64_t SqliteDB::AppliedVersion() {
  Exec(sql::kSchemaVersionTable);

  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> st(Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_version;"),
                                                                 &sqlite3_finalize);
  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    Throw(db_, rc, "sqlite schema version");
  }
  return sqlite3_column_int64(st.get(), 0);
}

void SqliteDB::ApplyStep(int64_t version, const std::string& sql) {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  Exec("BEGIN IMMEDIATE;");
  try {
    Exec(sql);
    Exec("INSERT INTO schema_version(version) VALUES (" + std::to_string(version) + ");");
    Exec("COMMIT;");
  } catch (const std::exception& e) {
    try {
      Exec("ROLLBACK;");
    } catch (const std::exception& rollback_error) {
      SUPERVISOR_LOG_WARN("sqlite migration rollback failed", {supervisor::observability::StringField("error", rollback_error.what())});
    }
    throw std::runtime_error("sqlite migration " + std::to_string(version) + ": " + e.what());
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    Throw(db_, rc, "sqlite prepare");
  }
  return stmt;
}

void SqliteDB::Configure(uint64_t busy_timeout_ms, bool wal_mode) {
  // WAL lets readers proceed while the writer holds the lock
  if (wal_mode && path_ != ":memory:") {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately, but never forever
  int rc = sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms));
  if (rc != SQLITE_OK) {
    Throw(db_, rc, "busy_timeout");
  }

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace supervisor::db::sqlite
