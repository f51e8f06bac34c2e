#include "entity_locator.hpp"

#include "internal/util/errors.hpp"

namespace artifact::maintenance {

db::model::BucketRecord EntityLocator::FindBucket(StorageSession& session, const RepositoryContext& context) const {
  auto bucket = session.FindBucket(context.repository_name);
  if (!bucket) {
    throw util::InvalidState("repository '" + context.repository_name + "' has no bucket");
  }
  return *bucket;
}

std::optional<db::model::ComponentRecord> EntityLocator::FindComponent(StorageSession& session, const artifact::model::EntityId& id,
                                                                       const db::model::BucketRecord& bucket) const {
  return session.FindComponent(id, bucket);
}

std::optional<db::model::AssetRecord> EntityLocator::FindAsset(StorageSession& session, const artifact::model::EntityId& id,
                                                               const db::model::BucketRecord& bucket) const {
  return session.FindAsset(id, bucket);
}

} // namespace artifact::maintenance
