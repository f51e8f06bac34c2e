#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

namespace artifact::storage::common {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& path_or_uri) {
  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(path_or_uri, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

} // namespace artifact::storage::common
