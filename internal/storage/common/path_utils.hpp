#pragma once

#include <stdexcept>
#include <string>

namespace artifact::storage::common {

inline void ValidateBlobId(const std::string& blob_id) {
  if (blob_id.empty()) {
    throw std::invalid_argument("blob id must not be empty");
  }
  for (char c : blob_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("blob id contains invalid character");
    }
  }
  if (blob_id == "." || blob_id == "..") {
    throw std::invalid_argument("blob id must not be a relative path component");
  }
}

/*
  Object key layout:

      <root>/<blob_id>.bytes

  Arrow filesystem paths always use '/' separators.
*/
inline std::string BlobPath(const std::string& root, const std::string& blob_id) {
  ValidateBlobId(blob_id);
  if (root.empty()) {
    return blob_id + ".bytes";
  }
  if (root.back() == '/') {
    return root + blob_id + ".bytes";
  }
  return root + "/" + blob_id + ".bytes";
}

} // namespace artifact::storage::common
