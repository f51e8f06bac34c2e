#pragma once

#include "internal/db/model/asset_record.hpp"
#include "internal/db/model/component_record.hpp"
#include "storage_session.hpp"

namespace artifact::maintenance {

/*
  Removes resolved records inside the caller's session.

  A component goes together with every asset it owns; the whole cascade is
  atomic with respect to the session's transaction. Blob deletes are only
  requested (see StorageSession::DeleteBlob). Store failures propagate.
*/
class CascadeDeleter {
 public:
  void DeleteComponent(StorageSession& session, const db::model::ComponentRecord& component, bool delete_blobs) const;

  void DeleteAsset(StorageSession& session, const db::model::AssetRecord& asset, bool delete_blob) const;
};

} // namespace artifact::maintenance
