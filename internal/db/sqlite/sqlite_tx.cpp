#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace artifact::db::sqlite {

namespace {

std::string Quote(const std::string& name) {
  std::string quoted = "\"";
  for (char c : name) {
    if (c == '"') quoted.push_back('"');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->AcquireTransaction();
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const Error&) {
    db_->ReleaseTransaction();
    throw;
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const Error& e) {
    ARTIFACT_LOG_WARN("sqlite rollback failed", {observability::ErrorField(e)});
  }
  Finish();
}

// a failed COMMIT leaves the transaction open; the destructor rolls it back
void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const Error&) {
    Finish();
    throw;
  }
  Finish();
}

void SqliteTransaction::Finish() {
  finished_ = true;
  db_->ReleaseTransaction();
}

void SqliteTransaction::Savepoint(const std::string& name) {
  db_->Exec("SAVEPOINT " + Quote(name) + ";");
}

void SqliteTransaction::ReleaseSavepoint(const std::string& name) {
  db_->Exec("RELEASE SAVEPOINT " + Quote(name) + ";");
}

void SqliteTransaction::RollbackToSavepoint(const std::string& name) {
  // ROLLBACK TO leaves the savepoint on the stack; RELEASE pops it
  db_->Exec("ROLLBACK TO SAVEPOINT " + Quote(name) + "; RELEASE SAVEPOINT " + Quote(name) + ";");
}

} // namespace artifact::db::sqlite
