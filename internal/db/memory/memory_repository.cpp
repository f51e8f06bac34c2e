#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace artifact::db::memory {

using artifact::model::EntityId;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertBucket(Transaction& t, const model::BucketRecord& r) {
  auto&       tx = TX(t);
  const auto& s  = tx.View();
  if (s.buckets.contains(r.repository_name)) return Result::Err(ErrorCode::AlreadyExists, "bucket exists for repository");
  for (const auto& [_, bucket] : s.buckets) {
    if (bucket.id == r.id) return Result::Err(ErrorCode::AlreadyExists, "bucket id in use");
  }
  tx.PutBucket(r);
  return Result::Ok();
}

std::optional<model::BucketRecord> MemoryRepository::FindBucket(Transaction& t, const std::string& repository_name) {
  const auto& s  = TX(t).View();
  auto        it = s.buckets.find(repository_name);
  if (it == s.buckets.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertComponent(Transaction& t, const model::ComponentRecord& r) {
  auto& tx = TX(t);
  if (tx.View().components.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  tx.PutComponent(r);
  return Result::Ok();
}

std::optional<model::ComponentRecord> MemoryRepository::FindComponent(Transaction& t, const EntityId& id, const EntityId& bucket_id) {
  const auto& s  = TX(t).View();
  auto        it = s.components.find(id);
  if (it == s.components.end() || it->second.bucket_id != bucket_id) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteComponent(Transaction& t, const EntityId& id) {
  auto&       tx = TX(t);
  const auto& s  = tx.View();
  if (!s.components.contains(id)) return Result::Err(ErrorCode::NotFound);
  // same rule as the SQL foreign key: owned assets must go first
  for (const auto& [_, asset] : s.assets) {
    if (asset.component_id && *asset.component_id == id) {
      return Result::Err(ErrorCode::ConstraintViolation, "component still owns assets");
    }
  }
  tx.EraseComponent(id);
  return Result::Ok();
}

Result MemoryRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
  auto&       tx = TX(t);
  const auto& s  = tx.View();
  if (s.assets.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  if (r.component_id && !s.components.contains(*r.component_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown owning component");
  }
  tx.PutAsset(r);
  return Result::Ok();
}

std::optional<model::AssetRecord> MemoryRepository::FindAsset(Transaction& t, const EntityId& id, const EntityId& bucket_id) {
  const auto& s  = TX(t).View();
  auto        it = s.assets.find(id);
  if (it == s.assets.end() || it->second.bucket_id != bucket_id) return std::nullopt;
  return it->second;
}

std::vector<model::AssetRecord> MemoryRepository::BrowseComponentAssets(Transaction& t, const EntityId& component_id) {
  const auto&                     s = TX(t).View();
  std::vector<model::AssetRecord> records;
  for (const auto& [_, asset] : s.assets) {
    if (asset.component_id && *asset.component_id == component_id) records.push_back(asset);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    return a.id < b.id;
  });
  return records;
}

Result MemoryRepository::DeleteAsset(Transaction& t, const EntityId& id) {
  if (!TX(t).EraseAsset(id)) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

} // namespace artifact::db::memory
