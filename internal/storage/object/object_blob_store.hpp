#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/blob_store.hpp"

namespace artifact::storage {

/*
  Blob store over an Arrow filesystem.

  Works for the local disk and for any remote filesystem Arrow was built
  with. Writes go to a temporary key and are moved into place, so readers
  never observe a partial blob on filesystems with atomic rename.
*/

class ObjectBlobStore final : public BlobStore {
 public:
  ObjectBlobStore(std::string name, std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  const std::string& Name() const override {
    return name_;
  }

  void Write(const std::string& blob_id, const std::shared_ptr<arrow::Buffer>& buffer) override;

  std::shared_ptr<arrow::Buffer> Read(const std::string& blob_id) override;

  bool Exists(const std::string& blob_id) override;

  bool Delete(const std::string& blob_id) override;

 private:
  std::string                            name_;
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace artifact::storage
