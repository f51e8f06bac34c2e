#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace artifact::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  // Creates the bucket/component/asset tables when missing.
  static void BootstrapSchema(PgPool& pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
