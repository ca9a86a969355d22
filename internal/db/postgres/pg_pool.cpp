#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace supervisor::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, uint64_t operation_timeout_ms)
    : conninfo_(std::move(conninfo)), max_connections_(std::max<std::size_t>(max_connections, 1)), operation_timeout_ms_(operation_timeout_ms) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(operation_timeout_ms_);

  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    if (auto conn = TakeIdle(lock)) {
      return Lend(std::move(conn));
    }

    if (live_connections_ < max_connections_) {
      // reserve the slot, connect without holding the lock
      ++live_connections_;
      lock.unlock();
      try {
        return Lend(Connect());
      } catch (...) {
        lock.lock();
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    const bool woke = cv_.wait_until(lock, deadline, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
    if (!woke) {
      throw supervisor::util::StoreUnavailable("postgres pool exhausted after " + std::to_string(operation_timeout_ms_) + "ms");
    }
  }
}

// Caller holds the lock. Drops idle connections the server has closed.
std::unique_ptr<pqxx::connection> PgPool::TakeIdle(std::unique_lock<std::mutex>&) {
  while (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) {
      return conn;
    }
    --live_connections_;
    SUPERVISOR_LOG_DEBUG("Discarded closed postgres connection");
  }
  return nullptr;
}

std::unique_ptr<pqxx::connection> PgPool::Connect() {
  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
  } catch (const pqxx::broken_connection& e) {
    throw supervisor::util::StoreUnavailable(std::string("postgres connect: ") + e.what());
  }

  const auto timeout = std::to_string(operation_timeout_ms_);
  pqxx::nontransaction session(*conn);
  session.exec("SET statement_timeout = " + timeout);
  session.exec("SET lock_timeout = " + timeout);
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = weak_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* c) {
    if (auto alive = pool.lock()) {
      alive->Return(c);
    } else {
      delete c;
    }
  });
}

void PgPool::Return(pqxx::connection* conn) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

int64_t PgMigrationExecutor::AppliedVersion() {
  pqxx::work tx(*conn_);
  tx.exec(sql::kSchemaVersionTable);
  const auto version = tx.exec("SELECT COALESCE(MAX(version), 0) FROM schema_version")[0][0].as<int64_t>();
  tx.commit();
  return version;
}

void PgMigrationExecutor::ApplyStep(int64_t version, const std::string& sql) {
  pqxx::work tx(*conn_);
  tx.exec(sql);
  tx.exec_params("INSERT INTO schema_version(version) VALUES ($1)", version);
  tx.commit();
}

} // namespace supervisor::db::postgres
