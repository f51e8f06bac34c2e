#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>
#include <vector>

namespace artifact::db::sqlite {

using artifact::db::ErrorCode;
using artifact::db::Result;
using artifact::model::EntityId;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Reads have no Result to carry a failure, so they throw.
static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  int           rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  if (rc != SQLITE_OK) {
    throw Error(TranslateCode(rc), sqlite3_errmsg(db));
  }
  return st;
}

static void FinalizeAndThrow(sqlite3* db, sqlite3_stmt* st, int rc) {
  std::string msg = sqlite3_errmsg(db);
  sqlite3_finalize(st);
  throw Error(TranslateCode(rc), msg);
}

static constexpr const char* kAssetColumns = "id,bucket_id,component_id,name,blob_store,blob_id,size_bytes";

static model::AssetRecord ReadAsset(sqlite3_stmt* st) {
  model::AssetRecord r;
  r.id        = EntityId(ColText(st, 0));
  r.bucket_id = EntityId(ColText(st, 1));
  if (sqlite3_column_type(st, 2) != SQLITE_NULL) {
    r.component_id = EntityId(ColText(st, 2));
  }
  r.name             = ColText(st, 3);
  r.blob_ref.store   = ColText(st, 4);
  r.blob_ref.blob_id = ColText(st, 5);
  r.size_bytes       = ColU64(st, 6);
  return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS bucket (id TEXT PRIMARY KEY, repository_name TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS component (id TEXT PRIMARY KEY, bucket_id TEXT NOT NULL REFERENCES bucket(id), format TEXT NOT NULL, "
      "group_name TEXT NOT NULL, name TEXT NOT NULL, version TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS asset (id TEXT PRIMARY KEY, bucket_id TEXT NOT NULL REFERENCES bucket(id), component_id TEXT REFERENCES component(id), "
      "name TEXT NOT NULL, blob_store TEXT NOT NULL, blob_id TEXT NOT NULL, size_bytes INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS asset_component_idx ON asset(component_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  auto code = TranslateCode(rc);
  if (code == ErrorCode::OK) return Result::Ok();
  return Result::Err(code, sqlite3_errmsg(db));
}

// ------------------------------------------------------------------
// Buckets
// ------------------------------------------------------------------

Result SqliteRepository::InsertBucket(Transaction& t, const model::BucketRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "INSERT INTO bucket(id,repository_name) VALUES(?,?);";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id.value());
  BindText(st, 2, r.repository_name);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::BucketRecord> SqliteRepository::FindBucket(Transaction& t, const std::string& repository_name) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, "SELECT id,repository_name FROM bucket WHERE repository_name=?;");

  BindText(st, 1, repository_name);

  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(st);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) FinalizeAndThrow(db, st, rc);

  model::BucketRecord r;
  r.id              = EntityId(ColText(st, 0));
  r.repository_name = ColText(st, 1);

  sqlite3_finalize(st);
  return r;
}

// ------------------------------------------------------------------
// Components
// ------------------------------------------------------------------

Result SqliteRepository::InsertComponent(Transaction& t, const model::ComponentRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "INSERT INTO component(id,bucket_id,format,group_name,name,version) VALUES(?,?,?,?,?,?);";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id.value());
  BindText(st, 2, r.bucket_id.value());
  BindText(st, 3, r.format);
  BindText(st, 4, r.group);
  BindText(st, 5, r.name);
  BindText(st, 6, r.version);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::ComponentRecord> SqliteRepository::FindComponent(Transaction& t, const EntityId& id, const EntityId& bucket_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, "SELECT id,bucket_id,format,group_name,name,version FROM component WHERE id=? AND bucket_id=?;");

  BindText(st, 1, id.value());
  BindText(st, 2, bucket_id.value());

  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(st);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) FinalizeAndThrow(db, st, rc);

  model::ComponentRecord r;
  r.id        = EntityId(ColText(st, 0));
  r.bucket_id = EntityId(ColText(st, 1));
  r.format    = ColText(st, 2);
  r.group     = ColText(st, 3);
  r.name      = ColText(st, 4);
  r.version   = ColText(st, 5);

  sqlite3_finalize(st);
  return r;
}

Result SqliteRepository::DeleteComponent(Transaction& t, const EntityId& id) {
  auto* db = TX(t).Handle();

  const char*   sql = "DELETE FROM component WHERE id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, id.value());
  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

Result SqliteRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "INSERT INTO asset(id,bucket_id,component_id,name,blob_store,blob_id,size_bytes) VALUES(?,?,?,?,?,?,?);";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id.value());
  BindText(st, 2, r.bucket_id.value());
  if (r.component_id) {
    BindText(st, 3, r.component_id->value());
  } else {
    sqlite3_bind_null(st, 3);
  }
  BindText(st, 4, r.name);
  BindText(st, 5, r.blob_ref.store);
  BindText(st, 6, r.blob_ref.blob_id);
  BindU64(st, 7, r.size_bytes);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::AssetRecord> SqliteRepository::FindAsset(Transaction& t, const EntityId& id, const EntityId& bucket_id) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kAssetColumns + " FROM asset WHERE id=? AND bucket_id=?;";
  auto* st  = PrepareOrThrow(db, sql.c_str());

  BindText(st, 1, id.value());
  BindText(st, 2, bucket_id.value());

  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(st);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) FinalizeAndThrow(db, st, rc);

  auto r = ReadAsset(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::AssetRecord> SqliteRepository::BrowseComponentAssets(Transaction& t, const EntityId& component_id) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kAssetColumns + " FROM asset WHERE component_id=? ORDER BY id;";
  auto* st  = PrepareOrThrow(db, sql.c_str());

  BindText(st, 1, component_id.value());

  std::vector<model::AssetRecord> out;
  int                             rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadAsset(st));
  }
  if (rc != SQLITE_DONE) FinalizeAndThrow(db, st, rc);

  sqlite3_finalize(st);
  return out;
}

Result SqliteRepository::DeleteAsset(Transaction& t, const EntityId& id) {
  auto* db = TX(t).Handle();

  const char*   sql = "DELETE FROM asset WHERE id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, id.value());
  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

} // namespace artifact::db::sqlite
