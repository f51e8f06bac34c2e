#include "memory_tx.hpp"

#include <algorithm>

namespace artifact::db::memory {

using artifact::model::EntityId;

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::EnsureOpen() const {
  if (committed_ || rolled_back_) {
    throw Error(ErrorCode::InternalError, "memory transaction is already closed");
  }
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw Error(ErrorCode::InternalError, "memory transaction was rolled back");
  }
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw Error(ErrorCode::Conflict, "transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
  savepoints_.clear();
  undo_log_.clear();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  savepoints_.clear();
  undo_log_.clear();
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------

void MemoryTransaction::PutBucket(const model::BucketRecord& bucket) {
  EnsureOpen();
  if (Logging()) {
    Undo undo{Undo::Table::kBucket, bucket.repository_name, {}, {}, {}};
    if (auto it = working_.buckets.find(bucket.repository_name); it != working_.buckets.end()) {
      undo.bucket = it->second;
    }
    undo_log_.push_back(std::move(undo));
  }
  working_.buckets[bucket.repository_name] = bucket;
}

void MemoryTransaction::PutComponent(const model::ComponentRecord& component) {
  EnsureOpen();
  if (Logging()) {
    Undo undo{Undo::Table::kComponent, component.id.value(), {}, {}, {}};
    if (auto it = working_.components.find(component.id); it != working_.components.end()) {
      undo.component = it->second;
    }
    undo_log_.push_back(std::move(undo));
  }
  working_.components[component.id] = component;
}

bool MemoryTransaction::EraseComponent(const EntityId& id) {
  EnsureOpen();
  auto it = working_.components.find(id);
  if (it == working_.components.end()) {
    return false;
  }
  if (Logging()) {
    undo_log_.push_back(Undo{Undo::Table::kComponent, id.value(), {}, it->second, {}});
  }
  working_.components.erase(it);
  return true;
}

void MemoryTransaction::PutAsset(const model::AssetRecord& asset) {
  EnsureOpen();
  if (Logging()) {
    Undo undo{Undo::Table::kAsset, asset.id.value(), {}, {}, {}};
    if (auto it = working_.assets.find(asset.id); it != working_.assets.end()) {
      undo.asset = it->second;
    }
    undo_log_.push_back(std::move(undo));
  }
  working_.assets[asset.id] = asset;
}

bool MemoryTransaction::EraseAsset(const EntityId& id) {
  EnsureOpen();
  auto it = working_.assets.find(id);
  if (it == working_.assets.end()) {
    return false;
  }
  if (Logging()) {
    undo_log_.push_back(Undo{Undo::Table::kAsset, id.value(), {}, {}, it->second});
  }
  working_.assets.erase(it);
  return true;
}

void MemoryTransaction::Apply(Undo& undo) {
  switch (undo.table) {
    case Undo::Table::kBucket:
      if (undo.bucket) {
        working_.buckets[undo.key] = std::move(*undo.bucket);
      } else {
        working_.buckets.erase(undo.key);
      }
      break;
    case Undo::Table::kComponent:
      if (undo.component) {
        working_.components[EntityId(undo.key)] = std::move(*undo.component);
      } else {
        working_.components.erase(EntityId(undo.key));
      }
      break;
    case Undo::Table::kAsset:
      if (undo.asset) {
        working_.assets[EntityId(undo.key)] = std::move(*undo.asset);
      } else {
        working_.assets.erase(EntityId(undo.key));
      }
      break;
  }
}

// ---------------------------------------------------------------------------
// Savepoints
// ---------------------------------------------------------------------------

MemoryTransaction::SavepointStack::iterator MemoryTransaction::FindSavepoint(const std::string& name) {
  // innermost savepoint with this name wins, as in SQL
  auto it = std::find_if(savepoints_.rbegin(), savepoints_.rend(), [&name](const auto& entry) {
    return entry.first == name;
  });
  if (it == savepoints_.rend()) {
    throw Error(ErrorCode::NotFound, "no such savepoint: " + name);
  }
  return std::next(it).base();
}

void MemoryTransaction::Savepoint(const std::string& name) {
  EnsureOpen();
  savepoints_.emplace_back(name, undo_log_.size());
}

void MemoryTransaction::ReleaseSavepoint(const std::string& name) {
  auto it = FindSavepoint(name);
  savepoints_.erase(it, savepoints_.end());
  // an enclosing savepoint may still need the entries; with none left they are dead
  if (savepoints_.empty()) {
    undo_log_.clear();
  }
}

void MemoryTransaction::RollbackToSavepoint(const std::string& name) {
  auto       it   = FindSavepoint(name);
  const auto mark = it->second;
  while (undo_log_.size() > mark) {
    Apply(undo_log_.back());
    undo_log_.pop_back();
  }
  savepoints_.erase(it, savepoints_.end());
  if (savepoints_.empty()) {
    undo_log_.clear();
  }
}

} // namespace artifact::db::memory
