#include "storage_session.hpp"

#include <algorithm>
#include <stdexcept>

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace artifact::maintenance {

using artifact::model::BlobRef;
using artifact::model::EntityId;

StorageSession::StorageSession(std::shared_ptr<db::Repository> repository, storage::BlobStorePtr blobs, SessionMode mode, std::string hint)
    : repository_(std::move(repository)), blobs_(std::move(blobs)), mode_(mode), hint_(std::move(hint)) {
  tx_ = TranslateDbErrors("begin " + hint_, [this] {
    return repository_->Begin();
  });
}

StorageSession::~StorageSession() {
  if (!tx_) {
    return;
  }
  try {
    tx_->Rollback();
  } catch (const std::exception& e) {
    ARTIFACT_LOG_WARN("Session rollback failed", {observability::StringField("hint", hint_), observability::ErrorField(e)});
  }
}

db::Transaction& StorageSession::Tx() {
  if (!tx_) {
    throw util::InvalidState("session '" + hint_ + "' is closed");
  }
  return *tx_;
}

std::optional<db::model::BucketRecord> StorageSession::FindBucket(const std::string& repository_name) {
  auto& tx = Tx();
  return TranslateDbErrors("find bucket", [&] {
    return repository_->FindBucket(tx, repository_name);
  });
}

std::optional<db::model::ComponentRecord> StorageSession::FindComponent(const EntityId& id, const db::model::BucketRecord& bucket) {
  auto& tx = Tx();
  return TranslateDbErrors("find component", [&] {
    return repository_->FindComponent(tx, id, bucket.id);
  });
}

std::optional<db::model::AssetRecord> StorageSession::FindAsset(const EntityId& id, const db::model::BucketRecord& bucket) {
  auto& tx = Tx();
  return TranslateDbErrors("find asset", [&] {
    return repository_->FindAsset(tx, id, bucket.id);
  });
}

std::vector<db::model::AssetRecord> StorageSession::BrowseComponentAssets(const db::model::ComponentRecord& component) {
  auto& tx = Tx();
  return TranslateDbErrors("browse component assets", [&] {
    return repository_->BrowseComponentAssets(tx, component.id);
  });
}

void StorageSession::RemoveComponentRecord(const db::model::ComponentRecord& component) {
  auto& tx = Tx();
  auto result = TranslateDbErrors("delete component", [&] {
    return repository_->DeleteComponent(tx, component.id);
  });
  ThrowIfDbError(result, "delete component " + component.id.value());
}

void StorageSession::RemoveAssetRecord(const db::model::AssetRecord& asset) {
  auto& tx = Tx();
  auto result = TranslateDbErrors("delete asset", [&] {
    return repository_->DeleteAsset(tx, asset.id);
  });
  ThrowIfDbError(result, "delete asset " + asset.id.value());
}

void StorageSession::DeleteBlob(const BlobRef& blob_ref) {
  Tx();
  pending_blob_deletes_.push_back(blob_ref);
}

std::vector<StorageSession::SavepointMark>::iterator StorageSession::FindSavepoint(const std::string& name) {
  auto it = std::find_if(savepoints_.rbegin(), savepoints_.rend(), [&name](const SavepointMark& mark) {
    return mark.name == name;
  });
  if (it == savepoints_.rend()) {
    throw util::InvalidState("no such savepoint: " + name);
  }
  return std::next(it).base();
}

void StorageSession::Savepoint(const std::string& name) {
  auto& tx = Tx();
  TranslateDbErrors("savepoint " + name, [&] {
    tx.Savepoint(name);
  });
  savepoints_.push_back({name, pending_blob_deletes_.size()});
}

void StorageSession::ReleaseSavepoint(const std::string& name) {
  auto& tx = Tx();
  auto  it = FindSavepoint(name);
  TranslateDbErrors("release savepoint " + name, [&] {
    tx.ReleaseSavepoint(name);
  });
  savepoints_.erase(it, savepoints_.end());
}

void StorageSession::RollbackToSavepoint(const std::string& name) {
  auto& tx = Tx();
  auto  it = FindSavepoint(name);
  // blob deletes are dropped even if the store fails to roll back: the
  // session can then only roll back entirely
  pending_blob_deletes_.resize(it->pending_blob_deletes);
  savepoints_.erase(it, savepoints_.end());
  TranslateDbErrors("rollback to savepoint " + name, [&] {
    tx.RollbackToSavepoint(name);
  });
}

void StorageSession::Commit() {
  auto& tx = Tx();
  if (!savepoints_.empty()) {
    throw util::InvalidState("commit of session '" + hint_ + "' with open savepoint " + savepoints_.back().name);
  }
  TranslateDbErrors("commit " + hint_, [&] {
    tx.Commit();
  });
  tx_.reset();
  FlushBlobDeletes();
}

void StorageSession::Rollback() {
  auto& tx = Tx();
  pending_blob_deletes_.clear();
  savepoints_.clear();
  auto closing = std::move(tx_);
  TranslateDbErrors("rollback " + hint_, [&] {
    tx.Rollback();
  });
}

void StorageSession::FlushBlobDeletes() {
  auto pending = std::move(pending_blob_deletes_);
  pending_blob_deletes_.clear();

  std::uint64_t deleted = 0;
  for (const auto& blob_ref : pending) {
    if (!blobs_ || (!blob_ref.store.empty() && blob_ref.store != blobs_->Name())) {
      ARTIFACT_LOG_WARN("No blob store for blob, leaving it to retention", {observability::StringField("blob", blob_ref.ToString())});
      continue;
    }
    try {
      if (blobs_->Delete(blob_ref.blob_id)) {
        ++deleted;
      } else {
        ARTIFACT_LOG_DEBUG("Blob already absent", {observability::StringField("blob", blob_ref.ToString())});
      }
    } catch (const std::exception& e) {
      ARTIFACT_LOG_WARN("Failed to delete blob after commit",
                        {observability::StringField("blob", blob_ref.ToString()), observability::ErrorField(e)});
    }
  }
  observability::Metrics::Instance().RecordDeletions("blob", deleted);
}

ItemSavepoint::ItemSavepoint(StorageSession& session, std::string name) : session_(session), name_(std::move(name)) {
  session_.Savepoint(name_);
}

ItemSavepoint::~ItemSavepoint() {
  if (done_) {
    return;
  }
  try {
    session_.RollbackToSavepoint(name_);
  } catch (const std::exception& e) {
    ARTIFACT_LOG_WARN("Savepoint rollback failed", {observability::StringField("savepoint", name_), observability::ErrorField(e)});
  }
}

void ItemSavepoint::Release() {
  done_ = true;
  session_.ReleaseSavepoint(name_);
}

void ItemSavepoint::Rollback() {
  done_ = true;
  session_.RollbackToSavepoint(name_);
}

} // namespace artifact::maintenance
