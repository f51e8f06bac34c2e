#include "component_maintenance.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace artifact::maintenance {

using artifact::model::EntityId;

namespace {

void RequireId(const EntityId& id, const char* what) {
  if (id.empty()) {
    throw std::invalid_argument(std::string(what) + " id must not be empty");
  }
}

} // namespace

DefaultComponentMaintenance::DefaultComponentMaintenance(std::shared_ptr<SessionProvider> sessions, RepositoryContext context,
                                                         MaintenanceOptions options)
    : context_(std::move(context)), scope_(std::move(sessions), options.commit_retries) {
}

void DefaultComponentMaintenance::DeleteComponent(const EntityId& component_id) {
  DeleteComponent(component_id, true);
}

void DefaultComponentMaintenance::DeleteComponent(const EntityId& component_id, bool delete_blobs) {
  RequireId(component_id, "component");

  bool deleted = false;
  scope_.RunSingle("delete component " + component_id.value(), [&](StorageSession& session) {
    auto bucket = locator_.FindBucket(session, context_);
    deleted     = DeleteComponentTx(session, bucket, component_id, delete_blobs);
  });
  observability::Metrics::Instance().RecordDeletions("component", deleted ? 1 : 0);
}

void DefaultComponentMaintenance::DeleteAsset(const EntityId& asset_id) {
  DeleteAsset(asset_id, true);
}

void DefaultComponentMaintenance::DeleteAsset(const EntityId& asset_id, bool delete_blob) {
  RequireId(asset_id, "asset");

  bool deleted = false;
  scope_.RunSingle("delete asset " + asset_id.value(), [&](StorageSession& session) {
    deleted     = false;
    auto bucket = locator_.FindBucket(session, context_);
    auto asset  = locator_.FindAsset(session, asset_id, bucket);
    if (!asset) {
      return;
    }
    deleter_.DeleteAsset(session, *asset, delete_blob);
    deleted = true;
  });
  observability::Metrics::Instance().RecordDeletions("asset", deleted ? 1 : 0);
}

std::uint64_t DefaultComponentMaintenance::DeleteComponents(std::span<const EntityId> component_ids, const CancelledCheck& cancelled_check,
                                                            int batch_size) {
  return DeleteComponentsWithReport(component_ids, cancelled_check, batch_size).deleted;
}

BatchReport DefaultComponentMaintenance::DeleteComponentsWithReport(std::span<const EntityId> component_ids, const CancelledCheck& cancelled_check,
                                                                    int batch_size) {
  BatchOrchestrator orchestrator(scope_, context_);
  auto report = orchestrator.Run(component_ids, cancelled_check, batch_size,
                                 [this](StorageSession& session, const db::model::BucketRecord& bucket, std::span<const EntityId> chunk,
                                        const CancelledCheck& check) {
                                   return DoBatchDelete(session, bucket, chunk, check);
                                 });
  observability::Metrics::Instance().RecordDeletions("component", report.deleted);
  After();
  return report;
}

void DefaultComponentMaintenance::After() {
}

std::vector<ItemResult> DefaultComponentMaintenance::DoBatchDelete(StorageSession& session, const db::model::BucketRecord& bucket,
                                                                   std::span<const EntityId> chunk, const CancelledCheck& cancelled_check) {
  std::vector<ItemResult> results;
  results.reserve(chunk.size());

  for (std::size_t i = 0; i < chunk.size(); ++i) {
    if (cancelled_check()) {
      break;
    }
    const auto& component_id = chunk[i];
    auto        result       = BatchOrchestrator::RunItem(session, component_id, i, [&](StorageSession& s) {
      return DeleteComponentTx(s, bucket, component_id, true);
    });
    if (result.status == ItemStatus::kDeleted) {
      ARTIFACT_LOG_DEBUG("Component deleted", {observability::IdField("component_id", component_id),
                                               observability::RepositoryField(context_.repository_name)});
    }
    results.push_back(std::move(result));
  }
  return results;
}

bool DefaultComponentMaintenance::DeleteComponentTx(StorageSession& session, const db::model::BucketRecord& bucket, const EntityId& component_id,
                                                    bool delete_blobs) {
  auto component = locator_.FindComponent(session, component_id, bucket);
  if (!component) {
    return false;
  }
  deleter_.DeleteComponent(session, *component, delete_blobs);
  return true;
}

} // namespace artifact::maintenance
