#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace artifact::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace artifact::grpc
