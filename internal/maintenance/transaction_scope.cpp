#include "transaction_scope.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace artifact::maintenance {

namespace {

class ActiveSessionGuard {
 public:
  explicit ActiveSessionGuard(bool& active) : active_(active) {
    active_ = true;
  }
  ~ActiveSessionGuard() {
    active_ = false;
  }

  ActiveSessionGuard(const ActiveSessionGuard&)            = delete;
  ActiveSessionGuard& operator=(const ActiveSessionGuard&) = delete;

 private:
  bool& active_;
};

} // namespace

TransactionScope::TransactionScope(std::shared_ptr<SessionProvider> provider, std::uint32_t commit_retries)
    : provider_(std::move(provider)), commit_retries_(commit_retries) {
  if (!provider_) {
    throw std::invalid_argument("transaction scope requires a session provider");
  }
}

void TransactionScope::RunSingle(const std::string& hint, const UnitOfWork& work) {
  Run(SessionMode::kSingle, hint, work);
}

void TransactionScope::RunChunk(const std::string& hint, const UnitOfWork& work) {
  Run(SessionMode::kBatch, hint, work);
}

void TransactionScope::Run(SessionMode mode, const std::string& hint, const UnitOfWork& work) {
  if (active_) {
    throw util::InvalidState("a session is already active in this scope (requested '" + hint + "')");
  }
  ActiveSessionGuard guard(active_);

  for (std::uint32_t attempt = 0;; ++attempt) {
    try {
      auto session = mode == SessionMode::kBatch ? provider_->BeginBatch(hint) : provider_->Begin(hint);
      work(*session);
      session->Commit();
      return;
    } catch (const util::ConcurrentModification& e) {
      if (attempt >= commit_retries_) {
        throw;
      }
      ARTIFACT_LOG_WARN("Retrying unit of work after concurrent modification",
                        {observability::StringField("hint", hint), observability::IntField("attempt", attempt + 1),
                         observability::ErrorField(e)});
    }
  }
}

} // namespace artifact::maintenance
