#include "maintenance_server.hpp"

#include "grpc_error.hpp"

namespace artifact::grpc {

MaintenanceServer::MaintenanceServer(std::shared_ptr<artifact::service::MaintenanceService> svc) : service_(std::move(svc)) {
}

::grpc::Status MaintenanceServer::DeleteComponent(::grpc::ServerContext*, const artifact::maintenance::v1::DeleteComponentRequest* req,
                                                  google::protobuf::Empty*) {
  try {
    service_->DeleteComponent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MaintenanceServer::DeleteAsset(::grpc::ServerContext*, const artifact::maintenance::v1::DeleteAssetRequest* req,
                                              google::protobuf::Empty*) {
  try {
    service_->DeleteAsset(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MaintenanceServer::DeleteComponents(::grpc::ServerContext* context, const artifact::maintenance::v1::DeleteComponentsRequest* req,
                                                   artifact::maintenance::v1::DeleteComponentsResponse* resp) {
  try {
    *resp = service_->DeleteComponents(*req, [context] {
      return context->IsCancelled();
    });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace artifact::grpc
