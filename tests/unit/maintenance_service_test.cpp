#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>

#include "artifact/maintenance/v1.hpp"
#include "internal/service/maintenance_service.hpp"
#include "tests/support/maintenance_fixture.hpp"

namespace {

using artifact::service::MaintenanceService;
using artifact::service::MaintenanceSettings;
using artifact::service::ServiceContext;
using artifact::testing::BlobId;
using artifact::testing::Fixture;

MaintenanceService MakeService(Fixture& fx, MaintenanceSettings settings = {}) {
  ServiceContext ctx;
  ctx.sessions = fx.sessions;
  ctx.settings = settings;
  return MaintenanceService(ctx);
}

artifact::maintenance::v1::DeleteComponentsRequest BatchRequest(std::initializer_list<const char*> ids) {
  artifact::maintenance::v1::DeleteComponentsRequest req;
  req.mutable_repository()->set_name("maven-releases");
  for (const auto* id : ids) {
    req.add_component_ids()->set_value(id);
  }
  return req;
}

void TestServiceRequiresSessions() {
  bool threw = false;
  try {
    MaintenanceService service(ServiceContext{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestResolveBatchSize() {
  Fixture fx;
  auto    service = MakeService(fx);

  assert(service.ResolveBatchSize(0) == 100);
  assert(service.ResolveBatchSize(7) == 7);
  assert(service.ResolveBatchSize(1000) == 1000);
  assert(service.ResolveBatchSize(5000) == 1000);

  bool threw = false;
  try {
    (void)service.ResolveBatchSize(-1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestDeleteBlobsDefaultsToTrue() {
  Fixture fx;
  fx.AddComponent("c1", 1);
  fx.AddComponent("c2", 1);
  auto service = MakeService(fx);

  artifact::maintenance::v1::DeleteComponentRequest req;
  req.mutable_repository()->set_name("maven-releases");
  req.mutable_component_id()->set_value("c1");
  service.DeleteComponent(req);
  assert(!fx.HasComponent("c1"));
  assert(!fx.HasBlob(BlobId("c1", 0)));

  req.mutable_component_id()->set_value("c2");
  req.set_delete_blobs(false);
  service.DeleteComponent(req);
  assert(!fx.HasComponent("c2"));
  assert(fx.HasBlob(BlobId("c2", 0)));
}

void TestDeleteAssetHonoursFlag() {
  Fixture fx;
  fx.AddStandaloneAsset("meta-1", "blob-meta-1");
  auto service = MakeService(fx);

  artifact::maintenance::v1::DeleteAssetRequest req;
  req.mutable_repository()->set_name("maven-releases");
  req.mutable_asset_id()->set_value("meta-1");
  req.set_delete_blob(false);
  service.DeleteAsset(req);

  assert(!fx.HasAsset("meta-1"));
  assert(fx.HasBlob("blob-meta-1"));
}

void TestMissingRepositoryIsRejected() {
  Fixture fx;
  auto    service = MakeService(fx);

  artifact::maintenance::v1::DeleteAssetRequest req;
  req.mutable_asset_id()->set_value("meta-1");

  bool threw = false;
  try {
    service.DeleteAsset(req);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(fx.sessions->begins == 0);
}

void TestBatchSizeIsClamped() {
  Fixture fx;
  for (const auto* id : {"A", "B", "C", "D", "E"}) {
    fx.AddComponent(id, 1);
  }
  auto service = MakeService(fx, MaintenanceSettings{.default_batch_size = 2, .max_batch_size = 2, .commit_retries = 0});

  auto req = BatchRequest({"A", "B", "C", "D", "E"});
  req.set_batch_size(50);
  auto resp = service.DeleteComponents(req);

  assert(resp.deleted_count() == 5);
  assert(resp.requested_count() == 5);
  assert(fx.sessions->batch_begins == 3);
}

void TestClientCancellationStopsBatch() {
  Fixture fx;
  fx.AddComponent("A", 1);
  auto service = MakeService(fx);

  auto resp = service.DeleteComponents(BatchRequest({"A"}), [] {
    return true;
  });

  assert(resp.cancelled());
  assert(resp.deleted_count() == 0);
  assert(resp.requested_count() == 1);
  assert(fx.HasComponent("A"));
}

void TestTimeoutStopsBatch() {
  Fixture fx;
  fx.AddComponent("A", 1);
  auto service = MakeService(fx);

  auto req = BatchRequest({"A"});
  req.set_timeout_ms(1);
  auto resp = service.DeleteComponents(req, [] {
    // let the deadline pass before the first poll completes
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return false;
  });

  assert(resp.cancelled());
  assert(resp.deleted_count() == 0);
  assert(fx.HasComponent("A"));
}

void TestResolveTimeout() {
  assert(!MaintenanceService::ResolveTimeout(0).has_value());
  assert(MaintenanceService::ResolveTimeout(250) == std::chrono::milliseconds(250));
  assert(MaintenanceService::ResolveTimeout(std::numeric_limits<std::uint64_t>::max()) == MaintenanceService::kMaxTimeout);
  assert(MaintenanceService::ResolveTimeout(static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1) ==
         MaintenanceService::kMaxTimeout);
}

void TestHugeTimeoutDoesNotCancel() {
  Fixture fx;
  fx.AddComponent("A", 1);
  fx.AddComponent("B", 1);
  auto service = MakeService(fx);

  auto req = BatchRequest({"A", "B"});
  req.set_timeout_ms(std::numeric_limits<std::uint64_t>::max());
  auto resp = service.DeleteComponents(req);

  assert(!resp.cancelled());
  assert(resp.deleted_count() == 2);
  assert(!fx.HasComponent("A"));
  assert(!fx.HasComponent("B"));
}

void TestZeroTimeoutMeansNone() {
  Fixture fx;
  fx.AddComponent("A", 1);
  fx.AddComponent("B", 1);
  auto service = MakeService(fx);

  auto resp = service.DeleteComponents(BatchRequest({"A", "B"}));

  assert(!resp.cancelled());
  assert(resp.deleted_count() == 2);
}

} // namespace

int main() {
  TestServiceRequiresSessions();
  TestResolveBatchSize();
  TestDeleteBlobsDefaultsToTrue();
  TestDeleteAssetHonoursFlag();
  TestMissingRepositoryIsRejected();
  TestBatchSizeIsClamped();
  TestClientCancellationStopsBatch();
  TestTimeoutStopsBatch();
  TestResolveTimeout();
  TestHugeTimeoutDoesNotCancel();
  TestZeroTimeoutMeansNone();

  std::cout << "artifact_unit_maintenance_service: pass\n";
  return 0;
}
