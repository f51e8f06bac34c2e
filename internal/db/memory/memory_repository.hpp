#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace artifact::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::BucketRecord>                    buckets;  // keyed by repository name
    std::unordered_map<artifact::model::EntityId, model::ComponentRecord> components;
    std::unordered_map<artifact::model::EntityId, model::AssetRecord>     assets;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
