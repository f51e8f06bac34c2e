#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/storage/blob_store.hpp"

namespace artifact::maintenance {

enum class SessionMode {
  kSingle,
  kBatch,
};

/*
  One unit of work against the entity store.

  A session owns exactly one db transaction and exposes the locator and
  mutator capabilities the deleters need. It is closed by Commit(),
  Rollback() or destruction (which rolls back).

  Blob deletions are deferred: DeleteBlob() only records the reference.
  The blob store is asked to delete after the transaction committed, so a
  rolled back transaction (or savepoint) never loses bytes. A blob delete
  that fails after commit is logged and does not fail the session.

  Db failures surface as util::ConcurrentModification, util::StoreUnavailable,
  util::NotFound or std::runtime_error (see db_errors.hpp).
*/
class StorageSession {
 public:
  StorageSession(std::shared_ptr<db::Repository> repository, storage::BlobStorePtr blobs, SessionMode mode, std::string hint);
  ~StorageSession();

  StorageSession(const StorageSession&)            = delete;
  StorageSession& operator=(const StorageSession&) = delete;

  SessionMode mode() const {
    return mode_;
  }

  const std::string& hint() const {
    return hint_;
  }

  bool IsOpen() const {
    return tx_ != nullptr;
  }

  // ---------------------------------------------------------------------
  // Locator capability
  // ---------------------------------------------------------------------

  std::optional<db::model::BucketRecord>    FindBucket(const std::string& repository_name);
  std::optional<db::model::ComponentRecord> FindComponent(const artifact::model::EntityId& id, const db::model::BucketRecord& bucket);
  std::optional<db::model::AssetRecord>     FindAsset(const artifact::model::EntityId& id, const db::model::BucketRecord& bucket);
  std::vector<db::model::AssetRecord>       BrowseComponentAssets(const db::model::ComponentRecord& component);

  // ---------------------------------------------------------------------
  // Mutator capability
  // ---------------------------------------------------------------------

  void RemoveComponentRecord(const db::model::ComponentRecord& component);
  void RemoveAssetRecord(const db::model::AssetRecord& asset);

  // Deferred until Commit().
  void DeleteBlob(const artifact::model::BlobRef& blob_ref);

  const std::vector<artifact::model::BlobRef>& PendingBlobDeletes() const {
    return pending_blob_deletes_;
  }

  // ---------------------------------------------------------------------
  // Savepoints
  // ---------------------------------------------------------------------

  void Savepoint(const std::string& name);
  void ReleaseSavepoint(const std::string& name);
  // Undoes record changes and drops blob deletes requested since the savepoint.
  void RollbackToSavepoint(const std::string& name);

  // ---------------------------------------------------------------------
  // Completion
  // ---------------------------------------------------------------------

  void Commit();
  void Rollback();

 private:
  struct SavepointMark {
    std::string name;
    std::size_t pending_blob_deletes;
  };

  db::Transaction& Tx();
  std::vector<SavepointMark>::iterator FindSavepoint(const std::string& name);
  void FlushBlobDeletes();

  std::shared_ptr<db::Repository>  repository_;
  storage::BlobStorePtr            blobs_;
  SessionMode                      mode_;
  std::string                      hint_;
  std::unique_ptr<db::Transaction> tx_;

  std::vector<artifact::model::BlobRef> pending_blob_deletes_;
  std::vector<SavepointMark>            savepoints_;
};

/*
  RAII savepoint scoping one batch item.

  Unless Release() is called, destruction rolls back to the savepoint.
*/
class ItemSavepoint {
 public:
  ItemSavepoint(StorageSession& session, std::string name);
  ~ItemSavepoint();

  ItemSavepoint(const ItemSavepoint&)            = delete;
  ItemSavepoint& operator=(const ItemSavepoint&) = delete;

  void Release();
  void Rollback();

 private:
  StorageSession& session_;
  std::string     name_;
  bool            done_ = false;
};

} // namespace artifact::maintenance
