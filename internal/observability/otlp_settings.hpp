#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace artifact::observability {

inline constexpr const char* kServiceName    = "artifact-maintenance";
inline constexpr const char* kServiceVersion = "0.1.0";

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

/*
  Where and how one signal is exported.

  The endpoint comes from the config, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  then OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the
  transport. TLS is used only for https:// endpoints.
*/
struct OtlpSettings {
  bool                      enabled = false;
  bool                      http    = false;
  std::string               endpoint;
  bool                      use_tls = false;
  std::chrono::milliseconds export_interval{1000};
};

inline OtlpSettings ResolveOtlpSettings(const artifact::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpSettings settings;
  settings.enabled = signal == OtlpSignal::kTraces ? observability.tracing_enabled() : observability.metrics_enabled();
  settings.http    = observability.transport() == artifact::runtime::config::OTLP_TRANSPORT_HTTP;

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (!observability.otlp_endpoint().empty()) {
    settings.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_env)) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else if (settings.http) {
    settings.endpoint = signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    settings.endpoint = "localhost:4317";
  }
  settings.use_tls = settings.endpoint.rfind("https://", 0) == 0;

  if (observability.metrics_collection_interval_ms() > 0) {
    settings.export_interval = std::chrono::milliseconds(observability.metrics_collection_interval_ms());
  }
  return settings;
}

} // namespace artifact::observability
