#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/storage/blob_store.hpp"
#include "storage_session.hpp"

namespace artifact::maintenance {

/*
  Opens sessions against the entity store.

  Begin() is used for single operations, BeginBatch() for one chunk of a
  batch. The hint names the unit of work in logs and errors.
*/
class SessionProvider {
 public:
  virtual ~SessionProvider() = default;

  virtual std::unique_ptr<StorageSession> Begin(const std::string& hint)      = 0;
  virtual std::unique_ptr<StorageSession> BeginBatch(const std::string& hint) = 0;
};

class DefaultSessionProvider final : public SessionProvider {
 public:
  DefaultSessionProvider(std::shared_ptr<db::Repository> repository, storage::BlobStorePtr blobs);

  std::unique_ptr<StorageSession> Begin(const std::string& hint) override;
  std::unique_ptr<StorageSession> BeginBatch(const std::string& hint) override;

 private:
  std::shared_ptr<db::Repository> repository_;
  storage::BlobStorePtr           blobs_;
};

} // namespace artifact::maintenance
