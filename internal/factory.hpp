#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"

namespace artifact::factory {

/*
  Application

  Owns every long-lived object the server needs. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root. The only place that knows concrete database and blob
  store types.
*/
Application Build(const artifact::runtime::config::RuntimeConfig& config);

// Exposed separately so tests can build a repository from config alone.
std::shared_ptr<db::Repository> BuildRepository(const artifact::runtime::config::RuntimeConfig& config);

service::MaintenanceSettings BuildSettings(const artifact::runtime::config::MaintenanceConfig& config);

} // namespace artifact::factory
