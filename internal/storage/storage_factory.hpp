#pragma once

#include <memory>

#include "blob_store.hpp"
#include "config/config.pb.h"

namespace artifact::storage {

/*
  Builds the blob store from configuration.

  An empty root_path keeps blobs in memory; anything else is handed to the
  Arrow filesystem resolver (plain path or URI).
*/

class StorageFactory {
public:
  static constexpr const char* kDefaultStoreName = "default";

  static BlobStorePtr Build(const artifact::runtime::config::BlobStoreConfig& cfg);
};

} // namespace artifact::storage
