#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "artifact/maintenance/v1/maintenance_service.grpc.pb.h"
#include "internal/service/maintenance_service.hpp"

namespace artifact::grpc {

class MaintenanceServer final : public artifact::maintenance::v1::ComponentMaintenanceService::Service {
public:
  explicit MaintenanceServer(std::shared_ptr<artifact::service::MaintenanceService> svc);

  ::grpc::Status DeleteComponent(::grpc::ServerContext*,
                                 const artifact::maintenance::v1::DeleteComponentRequest*,
                                 google::protobuf::Empty*) override;

  ::grpc::Status DeleteAsset(::grpc::ServerContext*,
                             const artifact::maintenance::v1::DeleteAssetRequest*,
                             google::protobuf::Empty*) override;

  ::grpc::Status DeleteComponents(::grpc::ServerContext*,
                                  const artifact::maintenance::v1::DeleteComponentsRequest*,
                                  artifact::maintenance::v1::DeleteComponentsResponse*) override;

private:
  std::shared_ptr<artifact::service::MaintenanceService> service_;
};

}
