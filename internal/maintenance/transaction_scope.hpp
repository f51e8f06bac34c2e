#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "session_provider.hpp"
#include "storage_session.hpp"

namespace artifact::maintenance {

using UnitOfWork = std::function<void(StorageSession&)>;

/*
  Opens and closes a session around one unit of work.

  RunSingle() uses SessionProvider::Begin, RunChunk() uses BeginBatch. The
  session is committed when the work returns and rolled back when it throws.
  Only one session may be active per scope; nesting throws InvalidState.

  When the work or its commit fails with util::ConcurrentModification the
  whole unit is re-run on a fresh session, up to commit_retries times. The
  work must therefore reset any state it accumulates.
*/
class TransactionScope {
 public:
  explicit TransactionScope(std::shared_ptr<SessionProvider> provider, std::uint32_t commit_retries = 0);

  void RunSingle(const std::string& hint, const UnitOfWork& work);
  void RunChunk(const std::string& hint, const UnitOfWork& work);

  bool HasActiveSession() const {
    return active_;
  }

 private:
  void Run(SessionMode mode, const std::string& hint, const UnitOfWork& work);

  std::shared_ptr<SessionProvider> provider_;
  std::uint32_t                    commit_retries_;
  bool                             active_ = false;
};

} // namespace artifact::maintenance
