#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <vector>

#include "batch_orchestrator.hpp"
#include "cascade_deleter.hpp"
#include "entity_locator.hpp"
#include "repository_context.hpp"
#include "session_provider.hpp"
#include "transaction_scope.hpp"

namespace artifact::maintenance {

/*
  Deletion operations on the components and assets of one repository.
*/
class ComponentMaintenance {
 public:
  virtual ~ComponentMaintenance() = default;

  // Deletes the component, its assets and their blobs. Absent is a no-op.
  virtual void DeleteComponent(const artifact::model::EntityId& component_id) = 0;
  virtual void DeleteComponent(const artifact::model::EntityId& component_id, bool delete_blobs) = 0;

  // Deletes the asset and its blob. Absent is a no-op.
  virtual void DeleteAsset(const artifact::model::EntityId& asset_id) = 0;
  virtual void DeleteAsset(const artifact::model::EntityId& asset_id, bool delete_blob) = 0;

  // Returns the number of components actually removed.
  virtual std::uint64_t DeleteComponents(std::span<const artifact::model::EntityId> component_ids, const CancelledCheck& cancelled_check,
                                         int batch_size) = 0;

  // Invoked once after every DeleteComponents call that returns normally,
  // cancelled or not.
  virtual void After() = 0;
};

struct MaintenanceOptions {
  std::uint32_t commit_retries = 0;
};

class DefaultComponentMaintenance : public ComponentMaintenance {
 public:
  DefaultComponentMaintenance(std::shared_ptr<SessionProvider> sessions, RepositoryContext context, MaintenanceOptions options = {});

  void DeleteComponent(const artifact::model::EntityId& component_id) override;
  void DeleteComponent(const artifact::model::EntityId& component_id, bool delete_blobs) override;

  void DeleteAsset(const artifact::model::EntityId& asset_id) override;
  void DeleteAsset(const artifact::model::EntityId& asset_id, bool delete_blob) override;

  std::uint64_t DeleteComponents(std::span<const artifact::model::EntityId> component_ids, const CancelledCheck& cancelled_check,
                                 int batch_size) override;

  // Full outcome of a batch; DeleteComponents() reports only `deleted`.
  BatchReport DeleteComponentsWithReport(std::span<const artifact::model::EntityId> component_ids, const CancelledCheck& cancelled_check,
                                         int batch_size);

  void After() override;

  const RepositoryContext& context() const {
    return context_;
  }

 protected:
  /*
    Per-chunk routine, the extension point for format-specific deletion.
    The default resolves each id in the bucket and cascades with blob
    deletion, one savepoint per item.
  */
  virtual std::vector<ItemResult> DoBatchDelete(StorageSession& session, const db::model::BucketRecord& bucket,
                                                std::span<const artifact::model::EntityId> chunk, const CancelledCheck& cancelled_check);

  const EntityLocator& locator() const {
    return locator_;
  }

  const CascadeDeleter& deleter() const {
    return deleter_;
  }

 private:
  bool DeleteComponentTx(StorageSession& session, const db::model::BucketRecord& bucket, const artifact::model::EntityId& component_id,
                         bool delete_blobs);

  RepositoryContext context_;
  TransactionScope  scope_;
  EntityLocator     locator_;
  CascadeDeleter    deleter_;
};

} // namespace artifact::maintenance
