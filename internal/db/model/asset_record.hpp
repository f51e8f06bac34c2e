#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/blob_ref.hpp"
#include "internal/model/entity_id.hpp"

namespace artifact::db::model {

/*
  Persistent asset row: metadata of one stored file.

  component_id is empty for standalone assets (e.g. repository metadata
  files). blob_ref is the content address of the bytes.
*/
struct AssetRecord {
  artifact::model::EntityId                id;
  artifact::model::EntityId                bucket_id;
  std::optional<artifact::model::EntityId> component_id;

  std::string              name;
  artifact::model::BlobRef blob_ref;
  uint64_t                 size_bytes = 0;
};

} // namespace artifact::db::model
