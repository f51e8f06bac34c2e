#pragma once

#include <sqlite3.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/db/api/result.hpp"

namespace artifact::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Exec() and Prepare() throw db::Error carrying the translated sqlite code.

  All sessions share this one connection, and a connection holds at most one
  transaction. AcquireTransaction() hands out that slot: a caller on another
  thread waits for it up to the busy timeout, the same bound sqlite applies
  to a competing process. Timing out, or asking again from the thread that
  already holds the slot, throws db::Error(Busy).
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  void AcquireTransaction();
  void ReleaseTransaction();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;

  std::mutex                     tx_mutex_;
  std::condition_variable        tx_released_;
  std::optional<std::thread::id> tx_owner_;
};

// Maps a (possibly extended) sqlite result code to a portable code.
ErrorCode TranslateCode(int rc);

} // namespace artifact::db::sqlite
