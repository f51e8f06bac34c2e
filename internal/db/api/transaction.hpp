#pragma once

#include <string>

namespace artifact::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Savepoints nest; RollbackToSavepoint() undoes every write made since the
    savepoint and discards it, ReleaseSavepoint() keeps the writes

  SQLite: BEGIN IMMEDIATE / SAVEPOINT
  Postgres: pqxx::work / pqxx::subtransaction
  Memory: snapshot copy-on-write, one copy per savepoint

  Failures are reported by throwing db::Error.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  virtual void Savepoint(const std::string& name) = 0;
  virtual void ReleaseSavepoint(const std::string& name) = 0;
  virtual void RollbackToSavepoint(const std::string& name) = 0;
};

} // namespace artifact::db
