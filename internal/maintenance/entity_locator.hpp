#pragma once

#include <optional>

#include "internal/db/model/asset_record.hpp"
#include "internal/db/model/bucket_record.hpp"
#include "internal/db/model/component_record.hpp"
#include "repository_context.hpp"
#include "storage_session.hpp"

namespace artifact::maintenance {

/*
  Resolves (EntityId, Bucket) to a record inside an active session.

  Unknown ids, ids already removed, and ids that live in another bucket all
  resolve to std::nullopt. Lookups have no side effects.
*/
class EntityLocator {
 public:
  // Throws util::InvalidState when the repository has no bucket.
  db::model::BucketRecord FindBucket(StorageSession& session, const RepositoryContext& context) const;

  std::optional<db::model::ComponentRecord> FindComponent(StorageSession& session, const artifact::model::EntityId& id,
                                                          const db::model::BucketRecord& bucket) const;

  std::optional<db::model::AssetRecord> FindAsset(StorageSession& session, const artifact::model::EntityId& id,
                                                  const db::model::BucketRecord& bucket) const;
};

} // namespace artifact::maintenance
