#include "ram_blob_store.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace artifact::storage {

RamBlobStore::RamBlobStore(std::string name) : name_(std::move(name)) {
}

void RamBlobStore::Write(const std::string& blob_id, const std::shared_ptr<arrow::Buffer>& buffer) {
  common::ValidateBlobId(blob_id);
  std::unique_lock lock(mutex_);
  buffers_[blob_id] = buffer;
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamBlobStore::Read(const std::string& blob_id) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(blob_id);
  if (it == buffers_.end()) throw util::NotFound("blob not found: " + name_ + "@" + blob_id);

  return it->second;
}

bool RamBlobStore::Exists(const std::string& blob_id) {
  std::shared_lock lock(mutex_);
  return buffers_.contains(blob_id);
}

bool RamBlobStore::Delete(const std::string& blob_id) {
  std::unique_lock lock(mutex_);
  return buffers_.erase(blob_id) > 0;
}

} // namespace artifact::storage
