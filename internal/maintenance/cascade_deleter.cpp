#include "cascade_deleter.hpp"

#include "internal/observability/logging.hpp"

namespace artifact::maintenance {

void CascadeDeleter::DeleteComponent(StorageSession& session, const db::model::ComponentRecord& component, bool delete_blobs) const {
  ARTIFACT_LOG_DEBUG("Deleting component", {observability::IdField("component_id", component.id),
                                             observability::StringField("component", component.ToStringExternal()),
                                             observability::BoolField("delete_blobs", delete_blobs)});

  // owned assets first: the store refuses to drop a component that still owns rows
  for (const auto& asset : session.BrowseComponentAssets(component)) {
    DeleteAsset(session, asset, delete_blobs);
  }
  session.RemoveComponentRecord(component);
}

void CascadeDeleter::DeleteAsset(StorageSession& session, const db::model::AssetRecord& asset, bool delete_blob) const {
  ARTIFACT_LOG_INFO("Deleting asset", {observability::IdField("asset_id", asset.id), observability::StringField("asset", asset.name),
                                       observability::StringField("blob", asset.blob_ref.ToString())});

  session.RemoveAssetRecord(asset);
  if (delete_blob) {
    session.DeleteBlob(asset.blob_ref);
  }
}

} // namespace artifact::maintenance
