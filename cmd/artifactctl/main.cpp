#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "artifact/maintenance/v1.hpp"

using namespace artifact::maintenance::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  artifactctl <addr> delete-component <repository> <component_id> [--keep-blobs]\n"
            << "  artifactctl <addr> delete-asset <repository> <asset_id> [--keep-blob]\n"
            << "  artifactctl <addr> delete-components <repository> [--batch-size N] [--timeout-ms N] <component_id>...\n";
}

static RepositoryRef MakeRepository(const std::string& name) {
  RepositoryRef repository;
  repository.set_name(name);
  return repository;
}

static EntityID MakeID(const std::string& value) {
  EntityID id;
  id.set_value(value);
  return id;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr       = argv[1];
  std::string cmd        = argv[2];
  std::string repository = argv[3];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ComponentMaintenanceService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "delete-component") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    DeleteComponentRequest req;
    *req.mutable_repository()   = MakeRepository(repository);
    *req.mutable_component_id() = MakeID(argv[4]);
    if (argc >= 6 && std::string(argv[5]) == "--keep-blobs") {
      req.set_delete_blobs(false);
    }

    google::protobuf::Empty resp;

    auto status = stub->DeleteComponent(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-asset") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    DeleteAssetRequest req;
    *req.mutable_repository() = MakeRepository(repository);
    *req.mutable_asset_id()   = MakeID(argv[4]);
    if (argc >= 6 && std::string(argv[5]) == "--keep-blob") {
      req.set_delete_blob(false);
    }

    google::protobuf::Empty resp;

    auto status = stub->DeleteAsset(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-components") {
    DeleteComponentsRequest req;
    *req.mutable_repository() = MakeRepository(repository);

    for (int i = 4; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--batch-size" && i + 1 < argc) {
        req.set_batch_size(std::stoi(argv[++i]));
      } else if (arg == "--timeout-ms" && i + 1 < argc) {
        req.set_timeout_ms(std::stoull(argv[++i]));
      } else {
        *req.add_component_ids() = MakeID(arg);
      }
    }

    DeleteComponentsResponse resp;

    auto status = stub->DeleteComponents(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "deleted=" << resp.deleted_count() << "\n";
    std::cout << "requested=" << resp.requested_count() << "\n";
    std::cout << "cancelled=" << (resp.cancelled() ? "true" : "false") << "\n";
    return 0;
  }

  Usage();
  return 1;
}
