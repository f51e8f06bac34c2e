#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "internal/maintenance/batch_orchestrator.hpp"
#include "internal/maintenance/cascade_deleter.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/maintenance_fixture.hpp"

namespace {

using artifact::db::ErrorCode;
using artifact::db::model::BucketRecord;
using artifact::maintenance::BatchOrchestrator;
using artifact::maintenance::BatchReport;
using artifact::maintenance::CancelledCheck;
using artifact::maintenance::CascadeDeleter;
using artifact::maintenance::ChunkRoutine;
using artifact::maintenance::EntityLocator;
using artifact::maintenance::ItemResult;
using artifact::maintenance::ItemStatus;
using artifact::maintenance::RepositoryContext;
using artifact::maintenance::StorageSession;
using artifact::maintenance::TransactionScope;
using artifact::model::EntityId;
using artifact::testing::AssetId;
using artifact::testing::BlobId;
using artifact::testing::Fixture;
using artifact::testing::Ids;

CancelledCheck Never() {
  return [] {
    return false;
  };
}

// locate-then-cascade per item, polling the check before every item
ChunkRoutine CascadeRoutine() {
  return [](StorageSession& session, const BucketRecord& bucket, std::span<const EntityId> chunk, const CancelledCheck& cancelled) {
    std::vector<ItemResult> results;
    for (std::size_t i = 0; i < chunk.size(); ++i) {
      if (cancelled()) {
        break;
      }
      const auto& id = chunk[i];
      results.push_back(BatchOrchestrator::RunItem(session, id, i, [&](StorageSession& s) {
        auto component = EntityLocator{}.FindComponent(s, id, bucket);
        if (!component) {
          return false;
        }
        CascadeDeleter{}.DeleteComponent(s, *component, true);
        return true;
      }));
    }
    return results;
  };
}

BatchReport RunBatch(Fixture& fx, const std::vector<EntityId>& ids, int batch_size, const CancelledCheck& cancelled,
                     std::uint32_t commit_retries = 0) {
  TransactionScope  scope(fx.sessions, commit_retries);
  BatchOrchestrator orchestrator(scope, RepositoryContext{"maven-releases"});
  return orchestrator.Run(ids, cancelled, batch_size, CascadeRoutine());
}

void TestCancelAfterThreeDeletions() {
  Fixture fx;
  for (const auto* id : {"A", "B", "C", "D", "E"}) {
    fx.AddComponent(id, 1);
  }

  auto report = RunBatch(fx, Ids({"A", "B", "C", "D", "E"}), 2, [&fx] {
    return fx.faults().component_deletes >= 3;
  });

  assert(report.deleted == 3);
  assert(report.cancelled);
  assert(report.chunks_committed == 2);
  assert(!fx.HasComponent("A"));
  assert(!fx.HasComponent("B"));
  assert(!fx.HasComponent("C"));
  assert(fx.HasComponent("D"));
  assert(fx.HasComponent("E"));
  // the third chunk was never opened
  assert(fx.sessions->batch_begins == 2);
}

void TestCancelledBeforeStartOpensNothing() {
  Fixture fx;
  fx.AddComponent("A", 1);

  auto report = RunBatch(fx, Ids({"A"}), 10, [] {
    return true;
  });

  assert(report.deleted == 0);
  assert(report.cancelled);
  assert(fx.sessions->batch_begins == 0);
  assert(fx.HasComponent("A"));
}

void TestCancellationKeepsCommittedPrefix() {
  Fixture fx;
  for (const auto* id : {"A", "B", "C", "D"}) {
    fx.AddComponent(id, 1);
  }

  int  polls  = 0;
  auto report = RunBatch(fx, Ids({"A", "B", "C", "D"}), 2, [&polls] {
    // chunk boundary, item A, item B, then the next chunk boundary
    return ++polls > 3;
  });

  assert(report.deleted == 2);
  assert(report.cancelled);
  assert(!fx.HasComponent("A"));
  assert(!fx.HasComponent("B"));
  assert(fx.HasComponent("C"));
  assert(fx.HasComponent("D"));
}

void TestFailingItemIsIsolated() {
  Fixture fx;
  for (const auto* id : {"A", "B", "C", "D"}) {
    fx.AddComponent(id, 2);
  }
  fx.faults().failing_component_deletes.insert("C");

  auto report = RunBatch(fx, Ids({"A", "B", "C", "D"}), 4, Never());

  assert(report.deleted == 3);
  assert(report.failed == 1);
  assert(report.chunks_committed == 1);
  assert(report.chunks_aborted == 0);
  assert(!report.cancelled);
  assert(!fx.HasComponent("A"));
  assert(!fx.HasComponent("B"));
  assert(!fx.HasComponent("D"));

  // the failed item's cascade was rolled back to its savepoint, blob deletes included
  assert(fx.HasComponent("C"));
  assert(fx.HasAsset(AssetId("C", 0)));
  assert(fx.HasAsset(AssetId("C", 1)));
  assert(fx.HasBlob(BlobId("C", 0)));
  assert(fx.HasBlob(BlobId("C", 1)));
  assert(!fx.HasBlob(BlobId("D", 1)));
}

void TestConflictingItemIsIsolatedWithoutRetry() {
  Fixture fx;
  for (const auto* id : {"A", "B", "C", "D"}) {
    fx.AddComponent(id, 1);
  }
  fx.faults().failing_component_deletes.insert("B");
  fx.faults().component_delete_code = ErrorCode::Conflict;

  auto report = RunBatch(fx, Ids({"A", "B", "C", "D"}), 4, Never(), 2);

  // the conflict stays inside B's savepoint: no chunk rerun, the rest commits
  assert(report.deleted == 3);
  assert(report.failed == 1);
  assert(report.chunks_committed == 1);
  assert(report.chunks_aborted == 0);
  assert(fx.sessions->batch_begins == 1);
  assert(fx.faults().commits == 1);
  assert(!fx.HasComponent("A"));
  assert(fx.HasComponent("B"));
  assert(fx.HasBlob(BlobId("B", 0)));
  assert(!fx.HasComponent("C"));
  assert(!fx.HasComponent("D"));
}

void TestSessionFaultBetweenChunks() {
  Fixture fx;
  for (const auto* id : {"A", "B", "C", "D", "E", "F"}) {
    fx.AddComponent(id, 1);
  }
  fx.sessions->failing_batch_begins.insert(2);

  auto report = RunBatch(fx, Ids({"A", "B", "C", "D", "E", "F"}), 2, Never());

  assert(report.deleted == 4);
  assert(report.chunks_committed == 2);
  assert(report.chunks_aborted == 1);
  assert(!fx.HasComponent("A"));
  assert(!fx.HasComponent("B"));
  assert(fx.HasComponent("C"));
  assert(fx.HasComponent("D"));
  assert(!fx.HasComponent("E"));
  assert(!fx.HasComponent("F"));
}

void TestUnavailableStoreAbortsOnlyItsChunk() {
  Fixture fx;
  for (const auto* id : {"A", "B", "C", "D"}) {
    fx.AddComponent(id, 1);
  }
  fx.faults().failing_asset_deletes.insert(AssetId("B", 0));
  fx.faults().asset_delete_code = ErrorCode::Busy;

  auto report = RunBatch(fx, Ids({"A", "B", "C", "D"}), 2, Never());

  assert(report.deleted == 2);
  assert(report.failed == 0);
  assert(report.chunks_aborted == 1);
  assert(report.chunks_committed == 1);
  // A was deleted before B failed, but the whole chunk rolled back
  assert(fx.HasComponent("A"));
  assert(fx.HasBlob(BlobId("A", 0)));
  assert(fx.HasComponent("B"));
  assert(!fx.HasComponent("C"));
  assert(!fx.HasComponent("D"));
}

void TestCommitConflictAbortsChunk() {
  Fixture fx;
  for (const auto* id : {"A", "B", "C", "D"}) {
    fx.AddComponent(id, 1);
  }
  fx.faults().commit_failures = 1;

  auto report = RunBatch(fx, Ids({"A", "B", "C", "D"}), 2, Never());

  assert(report.deleted == 2);
  assert(report.chunks_aborted == 1);
  assert(fx.HasComponent("A"));
  assert(fx.HasComponent("B"));
  assert(!fx.HasComponent("C"));
  assert(!fx.HasComponent("D"));
}

void TestCommitConflictRetriedWithinChunk() {
  Fixture fx;
  for (const auto* id : {"A", "B", "C"}) {
    fx.AddComponent(id, 1);
  }
  fx.faults().commit_failures = 1;

  auto report = RunBatch(fx, Ids({"A", "B", "C"}), 2, Never(), 1);

  // the retried chunk is counted once
  assert(report.deleted == 3);
  assert(report.chunks_committed == 2);
  assert(report.chunks_aborted == 0);
  assert(fx.sessions->batch_begins == 3);
}

void TestInvalidBatchSizeOpensNothing() {
  Fixture fx;
  fx.AddComponent("A", 1);

  for (int batch_size : {0, -1}) {
    bool threw = false;
    try {
      (void)RunBatch(fx, Ids({"A"}), batch_size, Never());
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  bool threw = false;
  try {
    (void)RunBatch(fx, Ids({"A"}), 1, CancelledCheck{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  assert(fx.sessions->batch_begins == 0);
  assert(fx.faults().begins == 0);
  assert(fx.HasComponent("A"));
}

void TestDuplicatesAndUnknownIdsAreAbsent() {
  Fixture fx;
  fx.AddComponent("A", 1);
  fx.AddComponent("B", 1);

  auto report = RunBatch(fx, Ids({"A", "A", "missing", "B", "A"}), 2, Never());

  assert(report.deleted == 2);
  assert(report.absent == 3);
  assert(report.failed == 0);
  assert(report.chunks_committed == 3);
}

void TestEmptyIdIsFailedItem() {
  Fixture fx;
  fx.AddComponent("A", 1);
  fx.AddComponent("B", 1);

  auto report = RunBatch(fx, Ids({"A", "", "B"}), 3, Never());

  assert(report.deleted == 2);
  assert(report.failed == 1);
  assert(!fx.HasComponent("A"));
  assert(!fx.HasComponent("B"));
}

void TestForeignBucketIdIsAbsent() {
  Fixture fx;
  auto    other = fx.AddBucket("maven-snapshots", "bucket-2");
  fx.AddComponentIn(other, "foreign", 1);
  fx.AddComponent("A", 1);

  auto report = RunBatch(fx, Ids({"foreign", "A"}), 5, Never());

  assert(report.deleted == 1);
  assert(report.absent == 1);
  assert(fx.HasComponentIn(other, "foreign"));
  assert(fx.HasBlob(BlobId("foreign", 0)));
}

void TestMissingBucketPropagates() {
  Fixture           fx;
  TransactionScope  scope(fx.sessions);
  BatchOrchestrator orchestrator(scope, RepositoryContext{"unknown-repository"});

  bool threw = false;
  try {
    (void)orchestrator.Run(Ids({"A"}), Never(), 1, CascadeRoutine());
  } catch (const artifact::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyInputFinishesImmediately() {
  Fixture fx;

  auto report = RunBatch(fx, {}, 3, Never());

  assert(report.deleted == 0);
  assert(!report.cancelled);
  assert(report.chunks_committed == 0);
  assert(fx.sessions->batch_begins == 0);
}

} // namespace

int main() {
  TestCancelAfterThreeDeletions();
  TestCancelledBeforeStartOpensNothing();
  TestCancellationKeepsCommittedPrefix();
  TestFailingItemIsIsolated();
  TestConflictingItemIsIsolatedWithoutRetry();
  TestSessionFaultBetweenChunks();
  TestUnavailableStoreAbortsOnlyItsChunk();
  TestCommitConflictAbortsChunk();
  TestCommitConflictRetriedWithinChunk();
  TestInvalidBatchSizeOpensNothing();
  TestDuplicatesAndUnknownIdsAreAbsent();
  TestEmptyIdIsFailedItem();
  TestForeignBucketIdIsAbsent();
  TestMissingBucketPropagates();
  TestEmptyInputFinishesImmediately();

  std::cout << "artifact_unit_batch_orchestrator: pass\n";
  return 0;
}
