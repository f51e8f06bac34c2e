#include "pg_repository.hpp"

#include <optional>
#include <string>

namespace artifact::db::postgres {

using artifact::model::EntityId;

namespace {

model::AssetRecord ReadAsset(const pqxx::row& row) {
  model::AssetRecord r;
  r.id        = EntityId(row[0].c_str());
  r.bucket_id = EntityId(row[1].c_str());
  if (!row[2].is_null()) {
    r.component_id = EntityId(row[2].c_str());
  }
  r.name             = row[3].c_str();
  r.blob_ref.store   = row[4].c_str();
  r.blob_ref.blob_id = row[5].c_str();
  r.size_bytes       = row[6].as<uint64_t>();
  return r;
}

// Reads have no Result to carry a failure, so they throw db::Error.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& e) {
    throw Error(TranslateException(e), e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS bucket (id TEXT PRIMARY KEY, repository_name TEXT NOT NULL UNIQUE);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS component (id TEXT PRIMARY KEY, bucket_id TEXT NOT NULL REFERENCES bucket(id), format TEXT NOT NULL, "
      "group_name TEXT NOT NULL, name TEXT NOT NULL, version TEXT NOT NULL);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS asset (id TEXT PRIMARY KEY, bucket_id TEXT NOT NULL REFERENCES bucket(id), component_id TEXT REFERENCES component(id), "
      "name TEXT NOT NULL, blob_store TEXT NOT NULL, blob_id TEXT NOT NULL, size_bytes BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS asset_component_idx ON asset(component_id);");
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  return Result::Err(TranslateException(e), e.what());
}

Result PgRepository::InsertBucket(Transaction& t, const model::BucketRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO bucket(id,repository_name) VALUES($1,$2);", r.id.value(), r.repository_name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BucketRecord> PgRepository::FindBucket(Transaction& t, const std::string& repository_name) {
  auto res = Read([&] {
    return TX(t).Work().exec_prepared("find_bucket", repository_name);
  });
  if (res.empty()) return std::nullopt;

  model::BucketRecord r;
  r.id              = EntityId(res[0][0].c_str());
  r.repository_name = res[0][1].c_str();
  return r;
}

Result PgRepository::InsertComponent(Transaction& t, const model::ComponentRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO component(id,bucket_id,format,group_name,name,version) VALUES($1,$2,$3,$4,$5,$6);", r.id.value(),
                             r.bucket_id.value(), r.format, r.group, r.name, r.version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ComponentRecord> PgRepository::FindComponent(Transaction& t, const EntityId& id, const EntityId& bucket_id) {
  auto res = Read([&] {
    return TX(t).Work().exec_prepared("find_component", id.value(), bucket_id.value());
  });
  if (res.empty()) return std::nullopt;

  model::ComponentRecord r;
  r.id        = EntityId(res[0][0].c_str());
  r.bucket_id = EntityId(res[0][1].c_str());
  r.format    = res[0][2].c_str();
  r.group     = res[0][3].c_str();
  r.name      = res[0][4].c_str();
  r.version   = res[0][5].c_str();
  return r;
}

Result PgRepository::DeleteComponent(Transaction& t, const EntityId& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_component", id.value());
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
  std::optional<std::string> component_id;
  if (r.component_id) component_id = r.component_id->value();

  try {
    TX(t).Work().exec_params("INSERT INTO asset(id,bucket_id,component_id,name,blob_store,blob_id,size_bytes) VALUES($1,$2,$3,$4,$5,$6,$7);",
                             r.id.value(), r.bucket_id.value(), component_id, r.name, r.blob_ref.store, r.blob_ref.blob_id, r.size_bytes);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AssetRecord> PgRepository::FindAsset(Transaction& t, const EntityId& id, const EntityId& bucket_id) {
  auto res = Read([&] {
    return TX(t).Work().exec_prepared("find_asset", id.value(), bucket_id.value());
  });
  if (res.empty()) return std::nullopt;
  return ReadAsset(res[0]);
}

std::vector<model::AssetRecord> PgRepository::BrowseComponentAssets(Transaction& t, const EntityId& component_id) {
  auto res = Read([&] {
    return TX(t).Work().exec_prepared("browse_component_assets", component_id.value());
  });

  std::vector<model::AssetRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadAsset(row));
  }
  return out;
}

Result PgRepository::DeleteAsset(Transaction& t, const EntityId& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_asset", id.value());
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace artifact::db::postgres
