#include "object_blob_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace artifact::storage {

using namespace artifact::storage::common;

ObjectBlobStore::ObjectBlobStore(std::string name, std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : name_(std::move(name)), fs_(std::move(fs)), root_path_(std::move(root_path)) {
  if (!root_path_.empty()) {
    Unwrap(fs_->CreateDir(root_path_, /*recursive=*/true));
  }
}

void ObjectBlobStore::Write(const std::string& blob_id, const std::shared_ptr<arrow::Buffer>& buffer) {
  auto final_path = BlobPath(root_path_, blob_id);
  auto tmp_path   = final_path + ".tmp";

  {
    auto out = Unwrap(fs_->OpenOutputStream(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    Unwrap(out->Close());
  }

  Unwrap(fs_->Move(tmp_path, final_path));
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ObjectBlobStore::Read(const std::string& blob_id) {
  auto path = BlobPath(root_path_, blob_id);
  if (!Exists(blob_id)) throw util::NotFound("blob not found: " + name_ + "@" + blob_id);
  return ReadAll(Unwrap(fs_->OpenInputFile(path)));
}

bool ObjectBlobStore::Exists(const std::string& blob_id) {
  auto info = Unwrap(fs_->GetFileInfo(BlobPath(root_path_, blob_id)));
  return info.type() == arrow::fs::FileType::File;
}

bool ObjectBlobStore::Delete(const std::string& blob_id) {
  auto path = BlobPath(root_path_, blob_id);
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() == arrow::fs::FileType::NotFound) {
    return false;
  }
  Unwrap(fs_->DeleteFile(path));
  return true;
}

} // namespace artifact::storage
