#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <string>

#include <arrow/buffer.h>

#include "internal/storage/blob_store.hpp"

namespace artifact::storage {

/*
  In-memory blob store.

  Backed by Arrow buffers kept in a map.
  Provides zero-copy reads to callers.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamBlobStore final : public BlobStore {
public:
  explicit RamBlobStore(std::string name);
  ~RamBlobStore() override = default;

  const std::string& Name() const override { return name_; }

  void Write(const std::string& blob_id,
             const std::shared_ptr<arrow::Buffer>& buffer) override;

  std::shared_ptr<arrow::Buffer> Read(const std::string& blob_id) override;

  bool Exists(const std::string& blob_id) override;

  bool Delete(const std::string& blob_id) override;

private:
  std::string name_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace artifact::storage
