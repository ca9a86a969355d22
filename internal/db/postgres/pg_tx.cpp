#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace supervisor::db::postgres {

namespace {

[[noreturn]] void Unavailable(const char* stage, const std::exception& e) {
  throw supervisor::util::StoreUnavailable(std::string("postgres ") + stage + ": " + e.what());
}

} // namespace

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()) {
  try {
    work_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::broken_connection& e) {
    Unavailable("begin", e);
  }
  open_ = true;
}

PgTransaction::~PgTransaction() {
  if (!open_) {
    return;
  }
  try {
    work_->abort();
  } catch (const std::exception& e) {
    SUPERVISOR_LOG_WARN("postgres rollback failed", {supervisor::observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (!open_) {
    throw std::logic_error("postgres transaction already finished");
  }
  // pqxx treats the transaction as done once commit() is attempted
  open_ = false;
  try {
    work_->commit();
  } catch (const pqxx::in_doubt_error& e) {
    Unavailable("commit outcome unknown", e);
  } catch (const pqxx::broken_connection& e) {
    Unavailable("commit", e);
  } catch (const pqxx::serialization_failure& e) {
    Unavailable("commit", e);
  }
}

void PgTransaction::Rollback() {
  if (!open_) {
    return;
  }
  open_ = false;
  work_->abort();
}

} // namespace supervisor::db::postgres
