#include "sqlite_db.hpp"

#include <chrono>

namespace artifact::db::sqlite {

ErrorCode TranslateCode(int rc) {
  if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
    return ErrorCode::AlreadyExists;
  }
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw Error(TranslateCode(rc), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms) : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw Error(TranslateCode(rc), msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw Error(TranslateCode(rc), msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  sqlite3_extended_result_codes(db_, 1);

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  // (in-memory databases silently keep their own journal mode)
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite; the asset -> component
  // reference relies on them
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms_), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::AcquireTransaction() {
  std::unique_lock lock(tx_mutex_);
  if (tx_owner_ == std::this_thread::get_id()) {
    throw Error(ErrorCode::Busy, "a transaction is already open on " + path_ + " in this thread");
  }
  if (!tx_released_.wait_for(lock, std::chrono::milliseconds(busy_timeout_ms_), [this] { return !tx_owner_.has_value(); })) {
    throw Error(ErrorCode::Busy, "timed out after " + std::to_string(busy_timeout_ms_) + "ms waiting for the open transaction on " + path_);
  }
  tx_owner_ = std::this_thread::get_id();
}

void SqliteDB::ReleaseTransaction() {
  {
    std::lock_guard lock(tx_mutex_);
    tx_owner_.reset();
  }
  tx_released_.notify_one();
}

} // namespace artifact::db::sqlite
