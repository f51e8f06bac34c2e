#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

namespace artifact::storage {

/*
  Content-addressed blob storage.

  Every blob is represented as an Arrow Buffer and addressed by an opaque
  blob id inside a named store. Blobs may be shared between assets; the
  store never knows which assets refer to a blob.

  Implementations:
    RAM      → in-memory Arrow buffers
    OBJECT   → Arrow filesystem (local path, S3, GCS, ...)
*/

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // Name that BlobRef::store refers to.
  virtual const std::string& Name() const = 0;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Persist a buffer under blob_id, replacing any previous content.
  */
  virtual void Write(const std::string& blob_id, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  /*
    Read the entire blob. Throws if it does not exist.
  */
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& blob_id) = 0;

  virtual bool Exists(const std::string& blob_id) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  /*
    Remove the blob. Returns false when there was nothing to remove;
    throws when the store failed.
  */
  virtual bool Delete(const std::string& blob_id) = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace artifact::storage
