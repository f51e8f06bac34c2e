#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

using artifact::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "artifact_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "/var/lib/artifact/store.db"
    busy_timeout_ms: 2500
blob_store:
  root_path: "/var/lib/artifact/blobs"
  store_name: "default"
maintenance:
  default_batch_size: 50
  max_batch_size: 500
  commit_retries: 2
logging:
  level: "debug"
  include_trace_context: true
observability:
  tracing_enabled: false
  metrics_enabled: true
  otlp_endpoint: "localhost:4317"
  transport: OTLP_TRANSPORT_GRPC
  metrics_collection_interval_ms: 5000
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/artifact/store.db");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.blob_store().root_path() == "/var/lib/artifact/blobs");
  assert(config.maintenance().default_batch_size() == 50);
  assert(config.maintenance().max_batch_size() == 500);
  assert(config.maintenance().commit_retries() == 2);
  assert(config.logging().level() == "debug");
  assert(config.logging().include_trace_context());
  assert(config.observability().metrics_enabled());
  assert(config.observability().transport() == artifact::runtime::config::OTLP_TRANSPORT_GRPC);
  assert(config.observability().metrics_collection_interval_ms() == 5000);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: "C:\\artifact\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\artifact\\\"quoted\"\\db.sqlite");
}

void TestMemoryDatabaseSelection() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
}

void TestMaintenanceDefaultsFollowSettings() {
  auto config   = ConfigLoader::LoadFromString("server:\n  bind_address: \"127.0.0.1:0\"\n");
  auto settings = artifact::factory::BuildSettings(config.maintenance());
  assert(settings.default_batch_size == 100);
  assert(settings.max_batch_size == 1000);
  assert(settings.commit_retries == 0);

  config   = ConfigLoader::LoadFromString("maintenance:\n  default_batch_size: 20\n");
  settings = artifact::factory::BuildSettings(config.maintenance());
  assert(settings.default_batch_size == 20);
  assert(settings.max_batch_size == 1000);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50051"
  unknown_key: true
)") && "ConfigLoader must reject unknown fields.");
  assert(Rejects("spill_workers:\n  threads: 1\n"));
}

void TestInconsistentValuesAreRejected() {
  assert(Rejects("maintenance:\n  default_batch_size: 500\n  max_batch_size: 10\n"));
  assert(Rejects("database:\n  sqlite:\n    busy_timeout_ms: 10\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/artifact/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestMemoryDatabaseSelection();
  TestMaintenanceDefaultsFollowSettings();
  TestUnknownFieldsAreRejected();
  TestInconsistentValuesAreRejected();
  TestMissingFileIsReported();

  std::cout << "artifact_unit_config_loader: pass\n";
  return 0;
}
