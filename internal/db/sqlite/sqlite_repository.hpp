#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace artifact::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the bucket/component/asset tables when missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBucket(Transaction&, const model::BucketRecord&) override;
  std::optional<model::BucketRecord> FindBucket(Transaction&, const std::string& repository_name) override;

  Result InsertComponent(Transaction&, const model::ComponentRecord&) override;
  std::optional<model::ComponentRecord> FindComponent(Transaction&, const artifact::model::EntityId& id,
                                                      const artifact::model::EntityId& bucket_id) override;
  Result DeleteComponent(Transaction&, const artifact::model::EntityId& id) override;

  Result InsertAsset(Transaction&, const model::AssetRecord&) override;
  std::optional<model::AssetRecord> FindAsset(Transaction&, const artifact::model::EntityId& id,
                                              const artifact::model::EntityId& bucket_id) override;
  std::vector<model::AssetRecord> BrowseComponentAssets(Transaction&, const artifact::model::EntityId& component_id) override;
  Result DeleteAsset(Transaction&, const artifact::model::EntityId& id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
