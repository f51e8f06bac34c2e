#include "session_provider.hpp"

#include <stdexcept>

namespace artifact::maintenance {

DefaultSessionProvider::DefaultSessionProvider(std::shared_ptr<db::Repository> repository, storage::BlobStorePtr blobs)
    : repository_(std::move(repository)), blobs_(std::move(blobs)) {
  if (!repository_) {
    throw std::invalid_argument("session provider requires a repository");
  }
}

std::unique_ptr<StorageSession> DefaultSessionProvider::Begin(const std::string& hint) {
  return std::make_unique<StorageSession>(repository_, blobs_, SessionMode::kSingle, hint);
}

std::unique_ptr<StorageSession> DefaultSessionProvider::BeginBatch(const std::string& hint) {
  return std::make_unique<StorageSession>(repository_, blobs_, SessionMode::kBatch, hint);
}

} // namespace artifact::maintenance
