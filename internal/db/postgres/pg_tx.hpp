#pragma once

#include <exception>
#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace artifact::db::postgres {

/*
  pqxx::work plus a stack of pqxx::subtransaction for savepoints.

  While a subtransaction is open only the innermost one may run statements,
  so repository code always goes through Work().
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::transaction_base& Work();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

  void Savepoint(const std::string& name) override;
  void ReleaseSavepoint(const std::string& name) override;
  void RollbackToSavepoint(const std::string& name) override;

private:
  using SavepointStack = std::vector<std::pair<std::string, std::unique_ptr<pqxx::subtransaction>>>;

  pqxx::dbtransaction& Innermost();
  SavepointStack::iterator FindSavepoint(const std::string& name);

  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  SavepointStack savepoints_;
  bool committed_ = false;
  bool finished_  = false;
};

// Maps a libpqxx exception to a portable code.
ErrorCode TranslateException(const std::exception& e);

}
