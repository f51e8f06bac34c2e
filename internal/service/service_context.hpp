#pragma once

#include <cstdint>
#include <memory>

namespace artifact::maintenance { class SessionProvider; }

namespace artifact::service {

struct MaintenanceSettings {
  int           default_batch_size = 100;
  int           max_batch_size     = 1000;
  std::uint32_t commit_retries     = 0;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<artifact::maintenance::SessionProvider> sessions;
  MaintenanceSettings settings;
};

}
