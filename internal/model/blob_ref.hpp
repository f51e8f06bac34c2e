#pragma once

#include <string>

namespace artifact::model {

/*
  Content address of a blob inside a named blob store.

  The reference is weak: the blob may be shared between assets or retained by
  the store after every asset pointing at it is gone.
*/
struct BlobRef {
  std::string store;
  std::string blob_id;

  std::string ToString() const {
    return store.empty() ? blob_id : store + "@" + blob_id;
  }

  friend bool operator==(const BlobRef&, const BlobRef&) = default;
};

} // namespace artifact::model
