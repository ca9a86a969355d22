#pragma once

namespace supervisor::db {

/*
  Unit of work against one repository.

  Every status change, transcript append and projection write happens
  inside one of these; a transaction that is destroyed without Commit()
  rolls back.

  Concurrency differs per backend and callers must not hold two at once
  on the same thread:
    memory   - holds the repository lock until finished
    sqlite   - BEGIN IMMEDIATE under the connection's writer mutex
    postgres - pqxx::work on a pooled connection
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;
};

} // namespace supervisor::db
