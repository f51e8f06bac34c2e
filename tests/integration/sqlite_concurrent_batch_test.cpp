#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#if ARTIFACT_DB_SQLITE

#include <arrow/buffer.h>

#include <atomic>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/maintenance/component_maintenance.hpp"
#include "internal/maintenance/session_provider.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"

namespace {

using artifact::db::model::AssetRecord;
using artifact::db::model::BucketRecord;
using artifact::db::model::ComponentRecord;
using artifact::maintenance::BatchReport;
using artifact::maintenance::DefaultComponentMaintenance;
using artifact::maintenance::DefaultSessionProvider;
using artifact::maintenance::RepositoryContext;
using artifact::model::EntityId;

// counts completion hooks across threads
class CountingMaintenance final : public DefaultComponentMaintenance {
 public:
  CountingMaintenance(std::shared_ptr<artifact::maintenance::SessionProvider> sessions, std::atomic<int>& after_calls)
      : DefaultComponentMaintenance(std::move(sessions), RepositoryContext{"maven-releases"}), after_calls_(after_calls) {
  }

  void After() override {
    after_calls_++;
  }

 private:
  std::atomic<int>& after_calls_;
};

struct SqliteStore {
  SqliteStore() {
    path = (std::filesystem::temp_directory_path() /
            ("artifact_concurrent_batch_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db"))
               .string();
    auto db = std::make_shared<artifact::db::sqlite::SqliteDB>(path);
    artifact::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    repository = std::make_shared<artifact::db::sqlite::SqliteRepository>(std::move(db));
    blobs      = std::make_shared<artifact::storage::RamBlobStore>("default");
    sessions   = std::make_shared<DefaultSessionProvider>(repository, blobs);

    auto tx = repository->Begin();
    assert(repository->InsertBucket(*tx, bucket));
    tx->Commit();
  }

  ~SqliteStore() {
    sessions.reset();
    repository.reset();
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
  }

  std::vector<EntityId> Seed(const std::string& prefix, int count) {
    std::vector<EntityId> ids;
    auto                  tx = repository->Begin();
    for (int i = 0; i < count; ++i) {
      ComponentRecord component;
      component.id        = EntityId(prefix + "-" + std::to_string(i));
      component.bucket_id = bucket.id;
      component.format    = "maven2";
      component.group     = "org.example";
      component.name      = component.id.value();
      component.version   = "1.0";
      assert(repository->InsertComponent(*tx, component));

      AssetRecord asset;
      asset.id           = EntityId(component.id.value() + "-jar");
      asset.bucket_id    = bucket.id;
      asset.component_id = component.id;
      asset.name         = "/org/example/" + component.id.value() + ".jar";
      asset.blob_ref     = {"default", "blob-" + component.id.value()};
      asset.size_bytes   = 4;
      assert(repository->InsertAsset(*tx, asset));
      blobs->Write(asset.blob_ref.blob_id, arrow::Buffer::FromString("data"));

      ids.push_back(component.id);
    }
    tx->Commit();
    return ids;
  }

  bool HasComponent(const EntityId& id) {
    auto tx    = repository->Begin();
    auto found = repository->FindComponent(*tx, id, bucket.id).has_value();
    tx->Rollback();
    return found;
  }

  std::string                                           path;
  BucketRecord                                          bucket{EntityId("bucket-1"), "maven-releases"};
  std::shared_ptr<artifact::db::sqlite::SqliteRepository> repository;
  std::shared_ptr<artifact::storage::RamBlobStore>      blobs;
  std::shared_ptr<DefaultSessionProvider>               sessions;
};

// one facade per caller, as the service builds one per request
void RunInThread(SqliteStore& store, const std::vector<EntityId>& ids, std::atomic<int>& after_calls, BatchReport& out) {
  CountingMaintenance maintenance(store.sessions, after_calls);
  out = maintenance.DeleteComponentsWithReport(ids, [] { return false; }, 3);
}

void TestDisjointBatchesBothFinish() {
  SqliteStore store;
  auto        left  = store.Seed("left", 20);
  auto        right = store.Seed("right", 20);

  std::atomic<int> after_calls{0};
  BatchReport      left_report;
  BatchReport      right_report;

  std::thread first([&] { RunInThread(store, left, after_calls, left_report); });
  std::thread second([&] { RunInThread(store, right, after_calls, right_report); });
  first.join();
  second.join();

  assert(left_report.deleted == 20);
  assert(right_report.deleted == 20);
  assert(left_report.chunks_aborted == 0);
  assert(right_report.chunks_aborted == 0);
  assert(left_report.failed == 0);
  assert(right_report.failed == 0);
  assert(after_calls == 2);

  for (const auto& id : left) {
    assert(!store.HasComponent(id));
    assert(!store.blobs->Exists("blob-" + id.value()));
  }
  for (const auto& id : right) {
    assert(!store.HasComponent(id));
  }
}

void TestOverlappingBatchesDeleteEachComponentOnce() {
  SqliteStore store;
  auto        shared = store.Seed("shared", 12);

  std::atomic<int> after_calls{0};
  BatchReport      first_report;
  BatchReport      second_report;

  std::thread first([&] { RunInThread(store, shared, after_calls, first_report); });
  std::thread second([&] { RunInThread(store, shared, after_calls, second_report); });
  first.join();
  second.join();

  // whichever chunk runs second finds its components already gone
  assert(first_report.deleted + second_report.deleted == 12);
  assert(first_report.deleted + first_report.absent == 12);
  assert(second_report.deleted + second_report.absent == 12);
  assert(first_report.chunks_aborted == 0);
  assert(second_report.chunks_aborted == 0);
  assert(after_calls == 2);

  for (const auto& id : shared) {
    assert(!store.HasComponent(id));
  }
}

} // namespace

int main() {
  TestDisjointBatchesBothFinish();
  TestOverlappingBatchesDeleteEachComponentOnce();
  std::cout << "artifact_integration_sqlite_concurrent_batch: pass\n";
  return 0;
}

#else

int main() {
  std::cout << "artifact_integration_sqlite_concurrent_batch: skipped (sqlite backend disabled)\n";
  return 0;
}

#endif
