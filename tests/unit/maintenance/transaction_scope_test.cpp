#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/maintenance/cascade_deleter.hpp"
#include "internal/maintenance/entity_locator.hpp"
#include "internal/maintenance/transaction_scope.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/maintenance_fixture.hpp"

namespace {

using artifact::maintenance::CascadeDeleter;
using artifact::maintenance::EntityLocator;
using artifact::maintenance::SessionMode;
using artifact::maintenance::StorageSession;
using artifact::maintenance::TransactionScope;
using artifact::model::EntityId;
using artifact::testing::Fixture;

void DeleteComponent(StorageSession& session, const Fixture& fx, const std::string& id) {
  EntityLocator locator;
  auto          component = locator.FindComponent(session, EntityId(id), fx.bucket);
  if (component) {
    CascadeDeleter{}.DeleteComponent(session, *component, true);
  }
}

void TestRunSingleCommits() {
  Fixture fx;
  fx.AddComponent("c1", 1);
  TransactionScope scope(fx.sessions);

  scope.RunSingle("single", [&](StorageSession& session) {
    assert(session.mode() == SessionMode::kSingle);
    assert(scope.HasActiveSession());
    DeleteComponent(session, fx, "c1");
  });

  assert(!scope.HasActiveSession());
  assert(fx.sessions->begins == 1);
  assert(fx.sessions->batch_begins == 0);
  assert(!fx.HasComponent("c1"));
}

void TestRunChunkUsesBatchSession() {
  Fixture fx;
  fx.AddComponent("c1", 1);
  TransactionScope scope(fx.sessions);

  scope.RunChunk("chunk", [&](StorageSession& session) {
    assert(session.mode() == SessionMode::kBatch);
    DeleteComponent(session, fx, "c1");
  });

  assert(fx.sessions->begins == 0);
  assert(fx.sessions->batch_begins == 1);
  assert(!fx.HasComponent("c1"));
}

void TestThrowingWorkRollsBack() {
  Fixture fx;
  fx.AddComponent("c1", 1);
  TransactionScope scope(fx.sessions);

  bool threw = false;
  try {
    scope.RunSingle("single", [&](StorageSession& session) {
      DeleteComponent(session, fx, "c1");
      throw std::logic_error("boom");
    });
  } catch (const std::logic_error&) {
    threw = true;
  }

  assert(threw);
  assert(!scope.HasActiveSession());
  assert(fx.faults().commits == 0);
  assert(fx.HasComponent("c1"));
  assert(fx.HasBlob(artifact::testing::BlobId("c1", 0)));
}

void TestNestedSessionIsRejected() {
  Fixture fx;
  fx.AddComponent("c1", 1);
  TransactionScope scope(fx.sessions);

  bool nested_rejected = false;
  scope.RunSingle("outer", [&](StorageSession& session) {
    try {
      scope.RunChunk("inner", [](StorageSession&) {});
    } catch (const artifact::util::InvalidState&) {
      nested_rejected = true;
    }
    // the outer session is still usable
    DeleteComponent(session, fx, "c1");
  });

  assert(nested_rejected);
  assert(fx.sessions->batch_begins == 0);
  assert(!fx.HasComponent("c1"));
}

void TestCommitConflictWithoutRetriesPropagates() {
  Fixture fx;
  fx.AddComponent("c1", 1);
  fx.faults().commit_failures = 1;
  TransactionScope scope(fx.sessions);

  int  runs  = 0;
  bool threw = false;
  try {
    scope.RunSingle("single", [&](StorageSession& session) {
      runs++;
      DeleteComponent(session, fx, "c1");
    });
  } catch (const artifact::util::ConcurrentModification&) {
    threw = true;
  }

  assert(threw);
  assert(runs == 1);
  assert(fx.HasComponent("c1"));
  // blobs of an uncommitted cascade are untouched
  assert(fx.HasBlob(artifact::testing::BlobId("c1", 0)));
}

void TestCommitConflictIsRetried() {
  Fixture fx;
  fx.AddComponent("c1", 1);
  fx.faults().commit_failures = 1;
  TransactionScope scope(fx.sessions, 1);

  int runs = 0;
  scope.RunSingle("single", [&](StorageSession& session) {
    runs++;
    DeleteComponent(session, fx, "c1");
  });

  assert(runs == 2);
  assert(fx.sessions->begins == 2);
  assert(!fx.HasComponent("c1"));
  assert(!fx.HasBlob(artifact::testing::BlobId("c1", 0)));
}

void TestRetriesAreBounded() {
  Fixture fx;
  fx.AddComponent("c1", 1);
  fx.faults().commit_failures = 5;
  TransactionScope scope(fx.sessions, 2);

  int  runs  = 0;
  bool threw = false;
  try {
    scope.RunChunk("chunk", [&](StorageSession& session) {
      runs++;
      DeleteComponent(session, fx, "c1");
    });
  } catch (const artifact::util::ConcurrentModification&) {
    threw = true;
  }

  assert(threw);
  assert(runs == 3);
  assert(fx.HasComponent("c1"));
}

void TestConcurrentWriterForcesRerun() {
  Fixture fx;
  fx.AddComponent("c1", 1);
  fx.AddComponent("c2", 1);
  TransactionScope scope(fx.sessions, 1);

  int runs = 0;
  scope.RunSingle("single", [&](StorageSession& session) {
    runs++;
    DeleteComponent(session, fx, "c1");
    if (runs == 1) {
      // another writer commits after our snapshot was taken
      auto other = fx.memory->Begin();
      assert(fx.memory->DeleteAsset(*other, EntityId(artifact::testing::AssetId("c2", 0))));
      other->Commit();
    }
  });

  assert(runs == 2);
  assert(!fx.HasComponent("c1"));
  assert(!fx.HasAsset(artifact::testing::AssetId("c2", 0)));
  assert(fx.HasComponent("c2"));
}

} // namespace

int main() {
  TestRunSingleCommits();
  TestRunChunkUsesBatchSession();
  TestThrowingWorkRollsBack();
  TestNestedSessionIsRejected();
  TestCommitConflictWithoutRetriesPropagates();
  TestCommitConflictIsRetried();
  TestRetriesAreBounded();
  TestConcurrentWriterForcesRerun();

  std::cout << "artifact_unit_transaction_scope: pass\n";
  return 0;
}
