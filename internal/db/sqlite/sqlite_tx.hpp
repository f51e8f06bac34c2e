#pragma once

#include <memory>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace artifact::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's transaction slot from construction until
  Commit()/Rollback() or destruction, so sessions on other threads wait for
  it instead of nesting BEGIN on the shared handle.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - a competing writer (another thread past the busy timeout, or another
      process) surfaces as Busy at Begin, never at Commit

  Savepoints map 1:1 onto SAVEPOINT / RELEASE / ROLLBACK TO.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

  void Savepoint(const std::string& name) override;
  void ReleaseSavepoint(const std::string& name) override;
  void RollbackToSavepoint(const std::string& name) override;

private:
  void Finish();

  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_  = false;
};

}
