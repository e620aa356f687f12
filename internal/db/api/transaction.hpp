#pragma once

namespace tripgraph::db {

/*
  Abstract unit of work over the graph store.

  Guaranteed by every backend:

  - Writes are invisible to other transactions until Commit()
  - Reads inside a write transaction see its own writes
  - Rollback() discards every write
  - Destructor rolls back if not committed

  Read-only transactions observe one committed snapshot and never take
  the writer lock.

  SQLite:   BEGIN IMMEDIATE (writer) / BEGIN on the reader connection
  Postgres: pqxx::work / read-only repeatable-read transaction
  Memory:   shared snapshot + private write set
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;

  virtual bool IsReadOnly() const = 0;
};

} // namespace tripgraph::db
