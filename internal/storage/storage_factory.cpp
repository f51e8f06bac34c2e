#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "object/object_blob_store.hpp"
#include "ram/ram_blob_store.hpp"

namespace artifact::storage {

BlobStorePtr StorageFactory::Build(const artifact::runtime::config::BlobStoreConfig& cfg) {
  std::string name = cfg.store_name().empty() ? kDefaultStoreName : cfg.store_name();

  if (cfg.root_path().empty()) {
    return std::make_shared<RamBlobStore>(std::move(name));
  }

  auto [fs, root] = common::Unwrap(common::ResolveFileSystem(cfg.root_path()));
  return std::make_shared<ObjectBlobStore>(std::move(name), std::move(fs), std::move(root));
}

} // namespace artifact::storage
