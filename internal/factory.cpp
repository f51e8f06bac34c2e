#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/maintenance_server.hpp"
#include "internal/maintenance/session_provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/maintenance_service.hpp"
#include "internal/storage/storage_factory.hpp"
#if ARTIFACT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ARTIFACT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace artifact::factory {

std::shared_ptr<db::Repository> BuildRepository(const artifact::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ARTIFACT_DB_SQLITE
    const auto& sqlite = database.sqlite();
    const int   busy   = sqlite.busy_timeout_ms() == 0 ? 5000 : static_cast<int>(sqlite.busy_timeout_ms());
    auto sqlite_db     = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), busy);
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    ARTIFACT_LOG_INFO("Using sqlite entity store", {observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ARTIFACT_DB_POSTGRES
    const auto& postgres = database.postgres();
    const auto  max_conn = postgres.max_connections() == 0 ? 16u : postgres.max_connections();
    auto pool            = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_conn);
    db::postgres::PgRepository::BootstrapSchema(*pool);
    ARTIFACT_LOG_INFO("Using postgres entity store", {observability::CountField("max_connections", max_conn)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ARTIFACT_LOG_INFO("Using in-memory entity store");
  return std::make_shared<db::memory::MemoryRepository>();
}

service::MaintenanceSettings BuildSettings(const artifact::runtime::config::MaintenanceConfig& config) {
  service::MaintenanceSettings settings;
  if (config.default_batch_size() != 0) {
    settings.default_batch_size = static_cast<int>(config.default_batch_size());
  }
  if (config.max_batch_size() != 0) {
    settings.max_batch_size = static_cast<int>(config.max_batch_size());
  }
  if (settings.default_batch_size > settings.max_batch_size) {
    settings.default_batch_size = settings.max_batch_size;
  }
  settings.commit_retries = config.commit_retries();
  return settings;
}

/*
    Build full application dependency graph
*/
Application Build(const artifact::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto blobs      = storage::StorageFactory::Build(config.blob_store());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.sessions = std::make_shared<maintenance::DefaultSessionProvider>(std::move(repository), std::move(blobs));
  ctx.settings = BuildSettings(config.maintenance());

  auto maintenance_service = std::make_shared<service::MaintenanceService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::MaintenanceServer>(maintenance_service));

  return app;
}

} // namespace artifact::factory
