#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/asset_record.hpp"
#include "internal/db/model/bucket_record.hpp"
#include "internal/db/model/component_record.hpp"

namespace artifact::db {

/*
  Repository abstraction over the component/asset store.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Lookups are scoped by bucket: an id stored in another bucket is absent
  - Deleting a record never touches blobs; blob lifecycle belongs to the
    blob store

  Insert operations exist for ingestion paths and seeding; the maintenance
  engine only reads and deletes.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Buckets
  // ---------------------------------------------------------------------

  virtual Result InsertBucket(Transaction&, const model::BucketRecord&) = 0;

  virtual std::optional<model::BucketRecord> FindBucket(Transaction&, const std::string& repository_name) = 0;

  // ---------------------------------------------------------------------
  // Components
  // ---------------------------------------------------------------------

  virtual Result InsertComponent(Transaction&, const model::ComponentRecord&) = 0;

  virtual std::optional<model::ComponentRecord> FindComponent(Transaction&, const artifact::model::EntityId& id,
                                                              const artifact::model::EntityId& bucket_id) = 0;

  // Removes the component row only; owned assets are removed by the caller.
  virtual Result DeleteComponent(Transaction&, const artifact::model::EntityId& id) = 0;

  // ---------------------------------------------------------------------
  // Assets
  // ---------------------------------------------------------------------

  virtual Result InsertAsset(Transaction&, const model::AssetRecord&) = 0;

  virtual std::optional<model::AssetRecord> FindAsset(Transaction&, const artifact::model::EntityId& id,
                                                      const artifact::model::EntityId& bucket_id) = 0;

  // Assets owned by the component, ordered by asset id.
  virtual std::vector<model::AssetRecord> BrowseComponentAssets(Transaction&, const artifact::model::EntityId& component_id) = 0;

  virtual Result DeleteAsset(Transaction&, const artifact::model::EntityId& id) = 0;
};

} // namespace artifact::db
