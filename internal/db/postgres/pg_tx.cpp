#include "pg_tx.hpp"

#include <algorithm>
#include <iterator>

#include "internal/observability/logging.hpp"

namespace artifact::db::postgres {

ErrorCode TranslateException(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return ErrorCode::SerializationFailure;
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return ErrorCode::Conflict;
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return ErrorCode::AlreadyExists;
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return ErrorCode::ConstraintViolation;
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return ErrorCode::IOError;
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e)) return ErrorCode::IOError;
  return ErrorCode::InternalError;
}

namespace {

template <typename Fn>
void Translated(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    throw;
  } catch (const std::exception& e) {
    throw Error(TranslateException(e), e.what());
  }
}

} // namespace

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  Translated([&] {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
  });
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    // subtransactions must close before their parent
    savepoints_.clear();
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      ARTIFACT_LOG_WARN("postgres rollback failed", {observability::ErrorField(e)});
    }
  }
}

pqxx::dbtransaction& PgTransaction::Innermost() {
  if (savepoints_.empty()) return *tx_;
  return *savepoints_.back().second;
}

pqxx::transaction_base& PgTransaction::Work() {
  return Innermost();
}

void PgTransaction::Commit() {
  if (!savepoints_.empty()) {
    throw Error(ErrorCode::InternalError, "commit with open savepoint " + savepoints_.back().first);
  }
  Translated([&] {
    tx_->commit();
  });
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  savepoints_.clear();
  Translated([&] {
    tx_->abort();
  });
}

PgTransaction::SavepointStack::iterator PgTransaction::FindSavepoint(const std::string& name) {
  auto it = std::find_if(savepoints_.rbegin(), savepoints_.rend(), [&name](const auto& entry) {
    return entry.first == name;
  });
  if (it == savepoints_.rend()) {
    throw Error(ErrorCode::NotFound, "no such savepoint: " + name);
  }
  return std::next(it).base();
}

void PgTransaction::Savepoint(const std::string& name) {
  Translated([&] {
    auto sub = std::make_unique<pqxx::subtransaction>(Innermost(), name);
    savepoints_.emplace_back(name, std::move(sub));
  });
}

void PgTransaction::ReleaseSavepoint(const std::string& name) {
  const auto depth = static_cast<std::size_t>(std::distance(savepoints_.begin(), FindSavepoint(name)));
  Translated([&] {
    // innermost first: each subtransaction commits into its parent
    while (savepoints_.size() > depth) {
      savepoints_.back().second->commit();
      savepoints_.pop_back();
    }
  });
}

void PgTransaction::RollbackToSavepoint(const std::string& name) {
  const auto depth = static_cast<std::size_t>(std::distance(savepoints_.begin(), FindSavepoint(name)));
  Translated([&] {
    while (savepoints_.size() > depth) {
      savepoints_.back().second->abort();
      savepoints_.pop_back();
    }
  });
}

} // namespace artifact::db::postgres
