#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace artifact::db::memory {

/*
  Transaction = snapshot + write set

  Commit is first-committer-wins: if another transaction committed after this
  snapshot was taken, Commit() throws db::Error(Conflict) and nothing is
  applied.

  While a savepoint is open every write logs its inverse; a savepoint is a
  position in that log, and rolling back replays the inverses above it.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  void Savepoint(const std::string& name) override;
  void ReleaseSavepoint(const std::string& name) override;
  void RollbackToSavepoint(const std::string& name) override;

  const MemoryRepository::State& View() const {
    return working_;
  }

  void PutBucket(const model::BucketRecord& bucket);
  void PutComponent(const model::ComponentRecord& component);
  bool EraseComponent(const artifact::model::EntityId& id);
  void PutAsset(const model::AssetRecord& asset);
  bool EraseAsset(const artifact::model::EntityId& id);

 private:
  // restores `key` to its prior record, or erases it when there was none
  struct Undo {
    enum class Table { kBucket, kComponent, kAsset };

    Table                                 table;
    std::string                           key;
    std::optional<model::BucketRecord>    bucket;
    std::optional<model::ComponentRecord> component;
    std::optional<model::AssetRecord>     asset;
  };

  using SavepointStack = std::vector<std::pair<std::string, std::size_t>>;

  void                     EnsureOpen() const;
  bool                     Logging() const {
    return !savepoints_.empty();
  }
  void                     Apply(Undo& undo);
  SavepointStack::iterator FindSavepoint(const std::string& name);

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;

  std::vector<Undo> undo_log_;
  SavepointStack    savepoints_; // name -> undo_log_ size when taken
};

} // namespace artifact::db::memory
