#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "entity_locator.hpp"
#include "repository_context.hpp"
#include "transaction_scope.hpp"

namespace artifact::maintenance {

using CancelledCheck = std::function<bool()>;

enum class ItemStatus {
  kDeleted,
  kAbsent, // unknown, duplicate or concurrently removed
  kFailed,
};

struct ItemResult {
  artifact::model::EntityId id;
  ItemStatus                status = ItemStatus::kAbsent;
  std::string               reason;
};

struct BatchReport {
  std::uint64_t deleted          = 0;
  std::uint64_t absent           = 0;
  std::uint64_t failed           = 0;
  std::uint64_t chunks_committed = 0;
  std::uint64_t chunks_aborted   = 0;
  bool          cancelled        = false;
};

// Processes one chunk inside its session. Returns one result per examined id;
// fewer results than ids means the cancellation check stopped the chunk.
using ChunkRoutine = std::function<std::vector<ItemResult>(StorageSession&, const db::model::BucketRecord&, std::span<const artifact::model::EntityId>,
                                                           const CancelledCheck&)>;

// Deletes one item. Returns true when something was removed, false when absent.
using ItemOperation = std::function<bool(StorageSession&)>;

/*
  Splits an id stream into fixed-size chunks and runs each chunk in its own
  session, strictly in input order.

    READY -> PARTITIONING -> (CHUNK_RUNNING -> CHUNK_DONE)* -> FINISHED

  - The cancellation check is polled before every chunk and (by the chunk
    routine) before every item. Work already committed is kept.
  - Chunks are atomic, the batch is not.
  - A chunk failing with StoreUnavailable, or with ConcurrentModification
    once retries are exhausted, is rolled back and logged; the next chunk
    starts on a fresh session. Other exceptions propagate.
*/
class BatchOrchestrator {
 public:
  BatchOrchestrator(TransactionScope& scope, RepositoryContext context);

  // Throws std::invalid_argument for batch_size < 1 or a missing check,
  // before any session is opened.
  BatchReport Run(std::span<const artifact::model::EntityId> ids, const CancelledCheck& cancelled, int batch_size, const ChunkRoutine& routine);

  /*
    Runs one item inside a savepoint named after its ordinal.

    An empty id, or any failure other than StoreUnavailable, becomes a
    kFailed result: the savepoint is rolled back and the failure logged, so
    the rest of the chunk still commits. StoreUnavailable propagates and
    aborts the chunk.
  */
  static ItemResult RunItem(StorageSession& session, const artifact::model::EntityId& id, std::size_t ordinal, const ItemOperation& operation);

 private:
  TransactionScope& scope_;
  RepositoryContext context_;
  EntityLocator     locator_;
};

} // namespace artifact::maintenance
